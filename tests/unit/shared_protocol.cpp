#include <cassert>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "remotefs/crypto.hpp"
#include "remotefs/error_codes.hpp"
#include "remotefs/protocol.hpp"
#include "remotefs/remote_path.hpp"

using namespace remotefs;
using namespace remotefs::protocol;

void run_tree_store_tests();
void run_transfer_tests();
void run_clipboard_tests();
void run_server_component_tests();

namespace
{

    void test_file_entry_json()
    {
        FileEntry entry{};
        entry.name = "link";
        entry.path = "/docs/link";
        entry.is_symlink = true;
        entry.symlink_target_is_directory = true;
        entry.symlink_target = std::string("/var/data");
        entry.size = 12;
        entry.modified_time = 1700000000;
        entry.permission_bits = 0755U;
        entry.children = std::vector<FileEntry>{};

        const auto json = nlohmann::json(entry);
        assert(json.at("is_symlink").get<bool>());
        assert(json.at("target_is_dir").get<bool>());
        assert(json.at("children").is_array());

        const auto decoded = json.get<FileEntry>();
        assert(decoded.is_directory_like());
        assert(decoded.symlink_target == entry.symlink_target);
        assert(decoded.permission_bits == entry.permission_bits);
        assert(decoded.children && decoded.children->empty());

        FileEntry plain{};
        plain.name = "a.txt";
        plain.path = "/a.txt";
        const auto plain_json = nlohmann::json(plain);
        assert(!plain_json.contains("children"));
        assert(!plain_json.contains("target_is_dir"));
        assert(!plain_json.get<FileEntry>().is_directory_like());
    }

    void test_transfer_event_decoding()
    {
        TransferTask task{};
        task.task_id = "abc";
        task.kind = TransferKind::Download;
        task.session_id = "s1";
        task.file_name = "report.pdf";
        task.total_bytes = 10;
        task.transferred_bytes = 4;
        task.status = TransferStatus::Transferring;
        task.eta_seconds = 3;

        const auto envelope = make_progress_event(task);
        assert(envelope.event == kTransferProgressEvent);
        const auto wire = nlohmann::json(envelope).dump();
        const auto parsed = nlohmann::json::parse(wire).get<EventEnvelope>();
        const auto decoded = parsed.payload.get<TransferTask>();
        assert(decoded.kind == TransferKind::Download);
        assert(decoded.status == TransferStatus::Transferring);
        assert(decoded.eta_seconds == task.eta_seconds);
        assert(!decoded.error);

        auto bad = nlohmann::json(task);
        bad["status"] = "paused";
        bool caught = false;
        try
        {
            (void)bad.get<TransferTask>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);

        assert(is_terminal(TransferStatus::Cancelled));
        assert(!is_terminal(TransferStatus::Transferring));
        assert(conflict_resolution_from_string("skip") == ConflictResolution::Skip);
        assert(sort_field_from_string("modified") == SortField::Modified);
        assert(!transfer_kind_from_string("sync"));
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::SessionNotFound) == "session_not_found");
        assert(to_string(ErrorCode::Skipped) == "skipped");
        assert(error_code_from_int(to_int(ErrorCode::Timeout)) == ErrorCode::Timeout);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_remote_paths()
    {
        assert(remote_path::normalize("") == "/");
        assert(remote_path::normalize("docs//a/") == "/docs/a");
        assert(remote_path::normalize("\\docs\\a") == "/docs/a");
        assert(remote_path::parent("/docs/a") == "/docs");
        assert(remote_path::parent("/docs") == "/");
        assert(remote_path::parent("/") == "/");
        assert(remote_path::join("/", "a") == "/a");
        assert(remote_path::join("/docs/", "a") == "/docs/a");
        assert(remote_path::file_name("C:\\tmp\\photo.jpg") == "photo.jpg");
        assert(remote_path::depth("/a/b/c") == 3);
        assert(remote_path::depth("/") == 0);
        assert(remote_path::is_same_or_descendant("/a/b", "/a"));
        assert(!remote_path::is_same_or_descendant("/ab", "/a"));
        assert(remote_path::is_root("."));
    }

    void test_task_ids()
    {
        std::set<std::string> ids;
        for (int i = 0; i < 64; ++i)
        {
            const auto id = crypto::generate_task_id();
            assert(id.size() == 36);
            assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
            assert(id[14] == '4');
            ids.insert(id);
        }
        assert(ids.size() == 64);
    }

} // namespace

int main()
{
    try
    {
        test_file_entry_json();
        test_transfer_event_decoding();
        test_error_codes();
        test_remote_paths();
        test_task_ids();
        run_tree_store_tests();
        run_transfer_tests();
        run_clipboard_tests();
        run_server_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
