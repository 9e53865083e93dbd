#include "remotefs/client/tree_store.hpp"

#include <algorithm>
#include <utility>

#include "remotefs/client/logger.hpp"
#include "remotefs/remote_path.hpp"

namespace remotefs::client
{

    namespace
    {

        void notify(const ResultHandler &done, const OperationResult &result)
        {
            if (done)
            {
                done(result);
            }
        }

        int compare_field(const protocol::FileEntry &lhs, const protocol::FileEntry &rhs, protocol::SortField field)
        {
            if (field == protocol::SortField::Modified)
            {
                if (lhs.modified_time == rhs.modified_time)
                {
                    return 0;
                }
                return lhs.modified_time < rhs.modified_time ? -1 : 1;
            }
            const auto cmp = lhs.name.compare(rhs.name);
            return cmp == 0 ? 0 : (cmp < 0 ? -1 : 1);
        }

    } // namespace

    TreeStore::TreeStore(RemoteService &service, Logger &logger)
        : service_(service), logger_(logger) {}

    void TreeStore::open(const std::string &session_id, ResultHandler done)
    {
        auto &tree = sessions_[session_id];
        if (tree.root_loaded || tree.pending_root_request != 0)
        {
            notify(done, OperationResult::success());
            return;
        }
        logger_.log("tree", "opening session ", session_id);
        request_listing(session_id, tree.current_path, {}, false, std::move(done));
    }

    void TreeStore::close(const std::string &session_id)
    {
        if (sessions_.erase(session_id) != 0)
        {
            logger_.log("tree", "closed session ", session_id);
        }
    }

    bool TreeStore::has_session(const std::string &session_id) const
    {
        return find_session(session_id) != nullptr;
    }

    void TreeStore::toggle(const std::string &session_id, const std::string &path, ResultHandler done)
    {
        auto *tree = find_session(session_id);
        if (!tree)
        {
            notify(done, OperationResult::failure(ErrorCode::SessionNotFound, "Unknown session " + session_id));
            return;
        }
        const auto normalized = remote_path::normalize(path);
        auto it = tree->nodes.find(normalized);
        if (it == tree->nodes.end())
        {
            notify(done, OperationResult::failure(ErrorCode::NotFound, "No such entry " + normalized));
            return;
        }
        auto &node = it->second;
        if (!node.entry.is_directory_like())
        {
            notify(done, OperationResult::success());
            return;
        }
        if (node.entry.expanded)
        {
            node.entry.expanded = false;
            notify(done, OperationResult::success());
            return;
        }
        if (node.pending_request != 0)
        {
            notify(done, OperationResult::failure(ErrorCode::Busy, "Listing already in progress"));
            return;
        }

        // Cached children show immediately; the listing below refreshes them.
        const bool cached = node.children_loaded;
        if (cached)
        {
            node.entry.expanded = true;
        }
        request_listing(session_id, normalized, {}, !cached, std::move(done));
    }

    void TreeStore::reload(const std::string &session_id, const std::string &path,
                           const std::set<std::string> &preserve_expanded, ResultHandler done)
    {
        auto *tree = find_session(session_id);
        if (!tree)
        {
            notify(done, OperationResult::failure(ErrorCode::SessionNotFound, "Unknown session " + session_id));
            return;
        }
        const auto normalized = remote_path::normalize(path);
        if (!is_root_path(*tree, normalized))
        {
            auto it = tree->nodes.find(normalized);
            if (it == tree->nodes.end())
            {
                notify(done, OperationResult::failure(ErrorCode::NotFound, "No such entry " + normalized));
                return;
            }
            const auto &node = it->second;
            if (!node.entry.is_directory_like())
            {
                notify(done, OperationResult::failure(ErrorCode::InvalidPayload, normalized + " is not a directory"));
                return;
            }
            if (!node.entry.expanded && !node.children_loaded)
            {
                // Never expanded: nothing cached to refresh.
                notify(done, OperationResult::success());
                return;
            }
        }
        request_listing(session_id, normalized, preserve_expanded, false, std::move(done));
    }

    void TreeStore::reload_preserving(const std::string &session_id, const std::string &path, ResultHandler done)
    {
        if (!find_session(session_id))
        {
            notify(done, OperationResult::failure(ErrorCode::SessionNotFound, "Unknown session " + session_id));
            return;
        }
        const auto normalized = remote_path::normalize(path);
        auto preserve = expanded_paths(session_id, normalized);
        std::vector<std::string> ordered(preserve.begin(), preserve.end());
        std::stable_sort(ordered.begin(), ordered.end(), [](const std::string &lhs, const std::string &rhs)
                         { return remote_path::depth(lhs) < remote_path::depth(rhs); });

        reload(session_id, normalized, preserve,
               [this, session_id, ordered = std::move(ordered), preserve, done = std::move(done)](
                   const OperationResult &result) mutable
               {
                   if (!result.ok())
                   {
                       notify(done, result);
                       return;
                   }
                   reload_chain(session_id, std::move(ordered), 0, std::move(preserve), std::move(done));
               });
    }

    void TreeStore::refresh(const std::string &session_id, ResultHandler done)
    {
        const auto *tree = find_session(session_id);
        if (!tree)
        {
            notify(done, OperationResult::failure(ErrorCode::SessionNotFound, "Unknown session " + session_id));
            return;
        }
        reload_preserving(session_id, tree->current_path, std::move(done));
    }

    void TreeStore::sort(const std::string &session_id, protocol::SortField field)
    {
        auto *tree = find_session(session_id);
        if (!tree)
        {
            return;
        }
        const bool flip = tree->sort.field == field && tree->sort.direction == protocol::SortDirection::Ascending;
        tree->sort.field = field;
        tree->sort.direction = flip ? protocol::SortDirection::Descending : protocol::SortDirection::Ascending;

        // Every level, collapsed subtrees included, so they reopen in the new order.
        sort_level(*tree, tree->roots);
        for (auto &[path, node] : tree->nodes)
        {
            sort_level(*tree, node.children);
        }
        logger_.log("tree", "session ", session_id, " sorted by ", protocol::to_string(tree->sort.field), ' ',
                    protocol::to_string(tree->sort.direction));
    }

    std::optional<protocol::SessionTreeState> TreeStore::snapshot(const std::string &session_id) const
    {
        const auto *tree = find_session(session_id);
        if (!tree)
        {
            return std::nullopt;
        }
        protocol::SessionTreeState state;
        state.current_path = tree->current_path;
        state.sort = tree->sort;
        state.loading = tree->loading;
        state.root_entries.reserve(tree->roots.size());
        for (const auto &path : tree->roots)
        {
            state.root_entries.push_back(build_snapshot(*tree, tree->nodes.at(path)));
        }
        return state;
    }

    std::optional<protocol::FileEntry> TreeStore::find(const std::string &session_id, const std::string &path) const
    {
        const auto *tree = find_session(session_id);
        if (!tree)
        {
            return std::nullopt;
        }
        auto it = tree->nodes.find(remote_path::normalize(path));
        if (it == tree->nodes.end())
        {
            return std::nullopt;
        }
        return build_snapshot(*tree, it->second);
    }

    std::optional<std::string> TreeStore::current_path(const std::string &session_id) const
    {
        const auto *tree = find_session(session_id);
        if (!tree)
        {
            return std::nullopt;
        }
        return tree->current_path;
    }

    std::set<std::string> TreeStore::expanded_paths(const std::string &session_id, const std::string &under) const
    {
        std::set<std::string> result;
        const auto *tree = find_session(session_id);
        if (!tree)
        {
            return result;
        }
        const auto normalized = remote_path::normalize(under);
        if (is_root_path(*tree, normalized))
        {
            collect_expanded(*tree, tree->roots, result);
            return result;
        }
        auto it = tree->nodes.find(normalized);
        if (it != tree->nodes.end())
        {
            collect_expanded(*tree, it->second.children, result);
        }
        return result;
    }

    std::optional<std::set<std::string>> TreeStore::cached_names(const std::string &session_id,
                                                                 const std::string &directory) const
    {
        const auto *tree = find_session(session_id);
        if (!tree)
        {
            return std::nullopt;
        }
        const auto normalized = remote_path::normalize(directory);
        const std::vector<std::string> *children = nullptr;
        if (is_root_path(*tree, normalized))
        {
            if (!tree->root_loaded)
            {
                return std::nullopt;
            }
            children = &tree->roots;
        }
        else
        {
            auto it = tree->nodes.find(normalized);
            if (it == tree->nodes.end() || !it->second.children_loaded)
            {
                return std::nullopt;
            }
            children = &it->second.children;
        }
        std::set<std::string> names;
        for (const auto &child : *children)
        {
            names.insert(tree->nodes.at(child).entry.name);
        }
        return names;
    }

    bool TreeStore::sorts_before(const protocol::FileEntry &lhs, const protocol::FileEntry &rhs,
                                 const protocol::SortState &sort)
    {
        if (lhs.is_directory_like() != rhs.is_directory_like())
        {
            return lhs.is_directory_like();
        }
        auto cmp = compare_field(lhs, rhs, sort.field);
        if (sort.direction == protocol::SortDirection::Descending)
        {
            cmp = -cmp;
        }
        return cmp < 0;
    }

    void TreeStore::sort_entries(std::vector<protocol::FileEntry> &entries, const protocol::SortState &sort)
    {
        std::stable_sort(entries.begin(), entries.end(), [&sort](const protocol::FileEntry &lhs, const protocol::FileEntry &rhs)
                         { return sorts_before(lhs, rhs, sort); });
    }

    TreeStore::SessionTree *TreeStore::find_session(const std::string &session_id)
    {
        auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : &it->second;
    }

    const TreeStore::SessionTree *TreeStore::find_session(const std::string &session_id) const
    {
        auto it = sessions_.find(session_id);
        return it == sessions_.end() ? nullptr : &it->second;
    }

    bool TreeStore::is_root_path(const SessionTree &tree, const std::string &path)
    {
        return remote_path::is_root(path) || path == tree.current_path;
    }

    void TreeStore::request_listing(const std::string &session_id, const std::string &path,
                                    std::set<std::string> preserve_expanded, bool expand_on_success,
                                    ResultHandler done)
    {
        auto &tree = *find_session(session_id);
        const auto request = ++next_request_;
        const bool root = is_root_path(tree, path);
        if (root)
        {
            tree.loading = true;
            tree.pending_root_request = request;
        }
        else
        {
            auto &node = tree.nodes.at(path);
            node.entry.loading = true;
            node.pending_request = request;
        }

        const auto listed_path = root ? tree.current_path : path;
        service_.list_directory(
            session_id, listed_path,
            [this, session_id, listed_path, request, preserve = std::move(preserve_expanded), expand_on_success,
             done = std::move(done)](const OperationResult &result, std::vector<protocol::FileEntry> entries)
            {
                on_listing(session_id, listed_path, request, preserve, expand_on_success, result, std::move(entries),
                           done);
            });
    }

    void TreeStore::on_listing(const std::string &session_id, const std::string &path, std::uint64_t request,
                               const std::set<std::string> &preserve_expanded, bool expand_on_success,
                               const OperationResult &result, std::vector<protocol::FileEntry> entries,
                               const ResultHandler &done)
    {
        auto *tree = find_session(session_id);
        if (!tree)
        {
            logger_.log("tree", "dropping listing of ", path, " for closed session ", session_id);
            notify(done, OperationResult::failure(ErrorCode::SessionNotFound, "Session closed"));
            return;
        }

        if (is_root_path(*tree, path))
        {
            if (tree->pending_root_request != request)
            {
                notify(done, OperationResult::failure(ErrorCode::Busy, "Listing superseded by a newer request"));
                return;
            }
            tree->pending_root_request = 0;
            tree->loading = false;
            if (!result.ok())
            {
                logger_.warn("tree", "listing ", path, " failed: ", to_string(result.error), ' ', result.message);
                notify(done, result);
                return;
            }
            replace_children(*tree, tree->roots, std::move(entries), preserve_expanded);
            tree->root_loaded = true;
            notify(done, OperationResult::success());
            return;
        }

        auto it = tree->nodes.find(path);
        if (it == tree->nodes.end() || it->second.pending_request != request)
        {
            notify(done, OperationResult::failure(ErrorCode::Busy, "Listing superseded by a newer request"));
            return;
        }
        it->second.pending_request = 0;
        it->second.entry.loading = false;
        if (!result.ok())
        {
            it->second.entry.expanded = false;
            logger_.warn("tree", "listing ", path, " failed: ", to_string(result.error), ' ', result.message);
            notify(done, result);
            return;
        }

        // replace_children may rehash the arena, so keep a copy of the slot while it works.
        auto children = std::move(it->second.children);
        replace_children(*tree, children, std::move(entries), preserve_expanded);
        auto &node = tree->nodes.at(path);
        node.children = std::move(children);
        node.children_loaded = true;
        if (expand_on_success)
        {
            node.entry.expanded = true;
        }
        notify(done, OperationResult::success());
    }

    void TreeStore::replace_children(SessionTree &tree, std::vector<std::string> &slot,
                                     std::vector<protocol::FileEntry> entries,
                                     const std::set<std::string> &preserve_expanded)
    {
        purge(tree, slot);
        slot.clear();
        slot.reserve(entries.size());
        for (auto &entry : entries)
        {
            entry.path = remote_path::normalize(entry.path);
            entry.children.reset();
            entry.expanded = false;
            entry.loading = false;
            if (entry.is_directory_like() && preserve_expanded.count(entry.path) != 0)
            {
                entry.expanded = true;
                entry.loading = true;
            }
            auto path = entry.path;
            if (auto existing = tree.nodes.find(path); existing != tree.nodes.end())
            {
                purge(tree, existing->second.children);
            }
            Node node;
            node.entry = std::move(entry);
            tree.nodes.insert_or_assign(path, std::move(node));
            slot.push_back(std::move(path));
        }
        sort_level(tree, slot);
    }

    void TreeStore::purge(SessionTree &tree, const std::vector<std::string> &paths)
    {
        for (const auto &path : paths)
        {
            auto it = tree.nodes.find(path);
            if (it == tree.nodes.end())
            {
                continue;
            }
            const auto children = std::move(it->second.children);
            tree.nodes.erase(it);
            purge(tree, children);
        }
    }

    void TreeStore::sort_level(SessionTree &tree, std::vector<std::string> &paths)
    {
        std::stable_sort(paths.begin(), paths.end(), [&tree](const std::string &lhs, const std::string &rhs)
                         { return sorts_before(tree.nodes.at(lhs).entry, tree.nodes.at(rhs).entry, tree.sort); });
    }

    void TreeStore::reload_chain(const std::string &session_id, std::vector<std::string> paths, std::size_t index,
                                 std::set<std::string> preserve_expanded, ResultHandler done)
    {
        if (index >= paths.size())
        {
            notify(done, OperationResult::success());
            return;
        }
        const auto path = paths[index];
        reload(session_id, path, preserve_expanded,
               [this, session_id, path, paths = std::move(paths), index, preserve_expanded,
                done = std::move(done)](const OperationResult &result) mutable
               {
                   if (!result.ok())
                   {
                       // A vanished or unreadable directory must not stop its siblings.
                       logger_.warn("tree", "reload of ", path, " skipped: ", to_string(result.error));
                   }
                   reload_chain(session_id, std::move(paths), index + 1, std::move(preserve_expanded),
                                std::move(done));
               });
    }

    protocol::FileEntry TreeStore::build_snapshot(const SessionTree &tree, const Node &node) const
    {
        auto entry = node.entry;
        if (node.children_loaded)
        {
            std::vector<protocol::FileEntry> children;
            children.reserve(node.children.size());
            for (const auto &child : node.children)
            {
                children.push_back(build_snapshot(tree, tree.nodes.at(child)));
            }
            entry.children = std::move(children);
        }
        return entry;
    }

    void TreeStore::collect_expanded(const SessionTree &tree, const std::vector<std::string> &level,
                                     std::set<std::string> &out) const
    {
        for (const auto &path : level)
        {
            const auto &node = tree.nodes.at(path);
            if (!node.entry.expanded)
            {
                continue;
            }
            out.insert(path);
            collect_expanded(tree, node.children, out);
        }
    }

} // namespace remotefs::client
