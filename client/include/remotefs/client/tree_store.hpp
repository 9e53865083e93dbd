#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "remotefs/protocol.hpp"
#include "remotefs/remote_service.hpp"

namespace remotefs::client
{

    class Logger;

    // Lazily materialized mirror of each session's remote directory tree.
    //
    // Nodes live in a per-session arena keyed by normalized path; parents refer to children by
    // path, so responses are matched to nodes by path equality and never by position. Every
    // listing request carries a generation number and only the newest request issued for a
    // path is allowed to update it.
    //
    // All methods must be called on the event loop thread. The store must outlive the listing
    // requests it issued.
    class TreeStore
    {
    public:
        TreeStore(RemoteService &service, Logger &logger);

        void open(const std::string &session_id, ResultHandler done = {});
        void close(const std::string &session_id);
        bool has_session(const std::string &session_id) const;

        void toggle(const std::string &session_id, const std::string &path, ResultHandler done = {});

        // Entries of the new listing whose path is in preserve_expanded come back marked
        // expanded and loading, ready for a follow-up reload of their own.
        void reload(const std::string &session_id, const std::string &path,
                    const std::set<std::string> &preserve_expanded = {}, ResultHandler done = {});

        // Reloads path, then every expanded descendant parents-first, one request at a time.
        void reload_preserving(const std::string &session_id, const std::string &path, ResultHandler done = {});

        void refresh(const std::string &session_id, ResultHandler done = {});

        void sort(const std::string &session_id, protocol::SortField field);

        std::optional<protocol::SessionTreeState> snapshot(const std::string &session_id) const;
        std::optional<protocol::FileEntry> find(const std::string &session_id, const std::string &path) const;
        std::optional<std::string> current_path(const std::string &session_id) const;

        // Expanded nodes reachable from under through expanded ancestors, under itself excluded.
        std::set<std::string> expanded_paths(const std::string &session_id, const std::string &under = "/") const;

        // Names of the cached children of a directory, std::nullopt when it was never listed.
        std::optional<std::set<std::string>> cached_names(const std::string &session_id,
                                                          const std::string &directory) const;

        static bool sorts_before(const protocol::FileEntry &lhs, const protocol::FileEntry &rhs,
                                 const protocol::SortState &sort);
        static void sort_entries(std::vector<protocol::FileEntry> &entries, const protocol::SortState &sort);

    private:
        struct Node
        {
            protocol::FileEntry entry;
            std::vector<std::string> children;
            bool children_loaded{};
            std::uint64_t pending_request{0};
        };

        struct SessionTree
        {
            std::vector<std::string> roots;
            std::unordered_map<std::string, Node> nodes;
            std::string current_path{"/"};
            protocol::SortState sort{};
            bool loading{};
            bool root_loaded{};
            std::uint64_t pending_root_request{0};
        };

        SessionTree *find_session(const std::string &session_id);
        const SessionTree *find_session(const std::string &session_id) const;
        static bool is_root_path(const SessionTree &tree, const std::string &path);

        void request_listing(const std::string &session_id, const std::string &path,
                             std::set<std::string> preserve_expanded, bool expand_on_success, ResultHandler done);
        void on_listing(const std::string &session_id, const std::string &path, std::uint64_t request,
                        const std::set<std::string> &preserve_expanded, bool expand_on_success,
                        const OperationResult &result, std::vector<protocol::FileEntry> entries,
                        const ResultHandler &done);
        void replace_children(SessionTree &tree, std::vector<std::string> &slot,
                              std::vector<protocol::FileEntry> entries,
                              const std::set<std::string> &preserve_expanded);
        void purge(SessionTree &tree, const std::vector<std::string> &paths);
        void sort_level(SessionTree &tree, std::vector<std::string> &paths);
        void reload_chain(const std::string &session_id, std::vector<std::string> paths, std::size_t index,
                          std::set<std::string> preserve_expanded, ResultHandler done);
        protocol::FileEntry build_snapshot(const SessionTree &tree, const Node &node) const;
        void collect_expanded(const SessionTree &tree, const std::vector<std::string> &level,
                              std::set<std::string> &out) const;

        RemoteService &service_;
        Logger &logger_;
        std::map<std::string, SessionTree> sessions_;
        std::uint64_t next_request_{0};
    };

} // namespace remotefs::client
