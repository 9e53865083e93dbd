#include <cassert>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "fake_remote_service.hpp"
#include "remotefs/client/logger.hpp"
#include "remotefs/client/tree_store.hpp"

using namespace remotefs;
using namespace remotefs::client;
using remotefs::test::FakeRemoteService;
using remotefs::test::make_entry;

namespace
{

    const std::string kSession = "s1";

    std::vector<std::string> names_of(const std::vector<protocol::FileEntry> &entries)
    {
        std::vector<std::string> names;
        for (const auto &entry : entries)
        {
            names.push_back(entry.name);
        }
        return names;
    }

    protocol::FileEntry dir_symlink(const std::string &path, std::uint64_t modified)
    {
        auto entry = make_entry(path, false, modified);
        entry.is_symlink = true;
        entry.symlink_target_is_directory = true;
        return entry;
    }

    void test_directories_sort_first()
    {
        std::vector<protocol::FileEntry> entries{
            make_entry("/a.txt", false, 40),
            make_entry("/zeta", true, 10),
            dir_symlink("/link", 30),
            make_entry("/c.txt", false, 5),
            make_entry("/beta", true, 20),
        };

        protocol::SortState sort{};
        TreeStore::sort_entries(entries, sort);
        assert((names_of(entries) == std::vector<std::string>{"beta", "link", "zeta", "a.txt", "c.txt"}));

        sort.direction = protocol::SortDirection::Descending;
        TreeStore::sort_entries(entries, sort);
        assert((names_of(entries) == std::vector<std::string>{"zeta", "link", "beta", "c.txt", "a.txt"}));

        sort.field = protocol::SortField::Modified;
        sort.direction = protocol::SortDirection::Ascending;
        TreeStore::sort_entries(entries, sort);
        assert((names_of(entries) == std::vector<std::string>{"zeta", "beta", "link", "c.txt", "a.txt"}));

        sort.direction = protocol::SortDirection::Descending;
        TreeStore::sort_entries(entries, sort);
        assert((names_of(entries) == std::vector<std::string>{"link", "beta", "zeta", "a.txt", "c.txt"}));
    }

    void test_open_and_toggle_caches_children()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.directories["/"] = {make_entry("/notes.txt", false), make_entry("/docs", true)};
        service.directories["/docs"] = {make_entry("/docs/a.txt", false)};

        TreeStore tree(service, logger);
        OperationResult opened = OperationResult::failure(ErrorCode::InternalError, "not called");
        tree.open(kSession, [&](const OperationResult &result)
                  { opened = result; });
        assert(opened.ok());

        auto state = tree.snapshot(kSession);
        assert(state && !state->loading);
        assert((names_of(state->root_entries) == std::vector<std::string>{"docs", "notes.txt"}));
        assert(!state->root_entries[0].children);

        // Opening again does not list again.
        tree.open(kSession);
        assert(service.listing_count("/") == 1);

        tree.toggle(kSession, "/docs");
        auto docs = tree.find(kSession, "/docs");
        assert(docs && docs->expanded && !docs->loading);
        assert(docs->children && docs->children->size() == 1);
        assert(service.listing_count("/docs") == 1);

        tree.toggle(kSession, "/docs");
        docs = tree.find(kSession, "/docs");
        assert(docs && !docs->expanded);
        assert(docs->children && docs->children->size() == 1);
        assert(service.listing_count("/docs") == 1);

        // Files never expand.
        tree.toggle(kSession, "/notes.txt");
        assert(!tree.find(kSession, "/notes.txt")->expanded);
        assert(service.listing_count("/notes.txt") == 0);

        OperationResult missing;
        tree.toggle(kSession, "/nope", [&](const OperationResult &result)
                    { missing = result; });
        assert(missing.error == ErrorCode::NotFound);
    }

    void test_toggle_marks_loading_until_response()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.directories["/"] = {make_entry("/docs", true)};
        service.directories["/docs"] = {make_entry("/docs/a.txt", false)};
        TreeStore tree(service, logger);
        tree.open(kSession);

        service.auto_list = false;
        tree.toggle(kSession, "/docs");
        auto docs = tree.find(kSession, "/docs");
        assert(docs->loading && !docs->expanded);

        OperationResult busy;
        tree.toggle(kSession, "/docs", [&](const OperationResult &result)
                    { busy = result; });
        assert(busy.error == ErrorCode::Busy);
        assert(service.pending.size() == 1);

        service.complete(0);
        docs = tree.find(kSession, "/docs");
        assert(!docs->loading && docs->expanded);
    }

    void test_listing_failure_leaves_node_collapsed()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.directories["/"] = {make_entry("/locked", true)};
        TreeStore tree(service, logger);
        tree.open(kSession);

        service.auto_list = false;
        OperationResult failed;
        tree.toggle(kSession, "/locked", [&](const OperationResult &result)
                    { failed = result; });
        service.fail(0, ErrorCode::PermissionDenied);
        assert(failed.error == ErrorCode::PermissionDenied);
        const auto locked = tree.find(kSession, "/locked");
        assert(!locked->loading && !locked->expanded && !locked->children);

        // Root failure keeps what was there.
        tree.reload(kSession, "/");
        assert(tree.snapshot(kSession)->loading);
        service.fail(0, ErrorCode::InternalError);
        const auto state = tree.snapshot(kSession);
        assert(!state->loading);
        assert(state->root_entries.size() == 1);
    }

    void test_reload_preserves_expansion_in_dependency_order()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.directories["/"] = {make_entry("/a", true)};
        service.directories["/a"] = {make_entry("/a/b", true)};
        service.directories["/a/b"] = {make_entry("/a/b/one.txt", false)};
        TreeStore tree(service, logger);
        tree.open(kSession);
        tree.toggle(kSession, "/a");
        tree.toggle(kSession, "/a/b");
        assert((tree.expanded_paths(kSession) == std::set<std::string>{"/a", "/a/b"}));

        service.directories["/a/b"] = {make_entry("/a/b/one.txt", false), make_entry("/a/b/two.txt", false)};
        service.auto_list = false;

        bool done = false;
        tree.reload_preserving(kSession, "/", [&](const OperationResult &result)
                               {
            assert(result.ok());
            done = true; });

        // One request at a time, parents first.
        assert(service.pending.size() == 1 && service.pending[0].path == "/");
        service.complete(0);
        auto a = tree.find(kSession, "/a");
        assert(a->expanded && a->loading);
        assert(service.pending.size() == 1 && service.pending[0].path == "/a");
        service.complete(0);
        assert(service.pending.size() == 1 && service.pending[0].path == "/a/b");
        service.complete(0);
        assert(done);

        a = tree.find(kSession, "/a");
        const auto b = tree.find(kSession, "/a/b");
        assert(a->expanded && !a->loading);
        assert(b->expanded && !b->loading);
        assert(b->children && b->children->size() == 2);
    }

    void test_stale_listing_is_dropped()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.directories["/"] = {make_entry("/a", true)};
        service.directories["/a"] = {make_entry("/a/old.txt", false)};
        TreeStore tree(service, logger);
        tree.open(kSession);
        tree.toggle(kSession, "/a");

        service.auto_list = false;
        OperationResult first;
        OperationResult second;
        tree.reload(kSession, "/a", {}, [&](const OperationResult &result)
                    { first = result; });
        service.complete(0);
        assert(first.ok());

        tree.reload(kSession, "/a", {}, [&](const OperationResult &result)
                    { first = result; });
        service.directories["/a"] = {make_entry("/a/new.txt", false)};
        tree.reload(kSession, "/a", {}, [&](const OperationResult &result)
                    { second = result; });
        assert(service.pending.size() == 2);

        // Newest answer first, the older one afterwards must not overwrite it.
        service.complete(1);
        assert(second.ok());
        service.directories["/a"] = {make_entry("/a/stale.txt", false)};
        service.complete(0);
        assert(first.error == ErrorCode::Busy);

        const auto a = tree.find(kSession, "/a");
        assert(a->children && a->children->size() == 1);
        assert(a->children->front().name == "new.txt");
    }

    void test_reload_of_unexpanded_node_is_noop()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.directories["/"] = {make_entry("/a", true), make_entry("/file", false)};
        TreeStore tree(service, logger);
        tree.open(kSession);

        OperationResult result = OperationResult::failure(ErrorCode::InternalError, "not called");
        tree.reload(kSession, "/a", {}, [&](const OperationResult &outcome)
                    { result = outcome; });
        assert(result.ok());
        assert(service.listing_count("/a") == 0);
        assert(!tree.find(kSession, "/a")->children);

        tree.reload(kSession, "/file", {}, [&](const OperationResult &outcome)
                    { result = outcome; });
        assert(result.error == ErrorCode::InvalidPayload);
    }

    void test_sort_toggles_direction_on_every_level()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.directories["/"] = {make_entry("/d", true), make_entry("/a.txt", false), make_entry("/b.txt", false)};
        service.directories["/d"] = {make_entry("/d/x", false, 1), make_entry("/d/y", false, 2)};
        TreeStore tree(service, logger);
        tree.open(kSession);
        tree.toggle(kSession, "/d");
        tree.toggle(kSession, "/d");

        tree.sort(kSession, protocol::SortField::Name);
        auto state = tree.snapshot(kSession);
        assert(state->sort.direction == protocol::SortDirection::Descending);
        assert((names_of(state->root_entries) == std::vector<std::string>{"d", "b.txt", "a.txt"}));
        // The collapsed subtree was re-sorted too.
        assert((names_of(*state->root_entries[0].children) == std::vector<std::string>{"y", "x"}));

        tree.sort(kSession, protocol::SortField::Modified);
        state = tree.snapshot(kSession);
        assert(state->sort.field == protocol::SortField::Modified);
        assert(state->sort.direction == protocol::SortDirection::Ascending);
        assert((names_of(*state->root_entries[0].children) == std::vector<std::string>{"x", "y"}));
    }

    void test_close_drops_late_responses()
    {
        Logger logger(std::nullopt);
        FakeRemoteService service;
        service.auto_list = false;
        service.directories["/"] = {make_entry("/a", true)};
        TreeStore tree(service, logger);

        OperationResult result;
        tree.open(kSession, [&](const OperationResult &outcome)
                  { result = outcome; });
        assert(tree.has_session(kSession));
        tree.close(kSession);
        service.complete(0);
        assert(result.error == ErrorCode::SessionNotFound);
        assert(!tree.snapshot(kSession));
    }

} // namespace

void run_tree_store_tests()
{
    test_directories_sort_first();
    test_open_and_toggle_caches_children();
    test_toggle_marks_loading_until_response();
    test_listing_failure_leaves_node_collapsed();
    test_reload_preserves_expansion_in_dependency_order();
    test_stale_listing_is_dropped();
    test_reload_of_unexpanded_node_is_noop();
    test_sort_toggles_direction_on_every_level();
    test_close_drops_late_responses();
}
