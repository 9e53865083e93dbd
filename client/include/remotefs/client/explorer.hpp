#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>

#include "remotefs/client/clipboard.hpp"
#include "remotefs/client/conflict_resolver.hpp"
#include "remotefs/client/event_bus.hpp"
#include "remotefs/client/transfer_coordinator.hpp"
#include "remotefs/client/tree_store.hpp"
#include "remotefs/remote_service.hpp"

namespace remotefs::client
{

    class Logger;

    // Parses "644" style text; std::nullopt for anything that is not one to four octal digits.
    std::optional<std::uint32_t> parse_octal_permissions(std::string_view text);

    // Low nine bits as three octal digits, "755" when the mode is unknown.
    std::string permissions_to_octal(const std::optional<std::uint32_t> &mode);

    // Everything one explorer window needs: the trees of its sessions, the transfer list,
    // pending conflicts and the clipboard, plus the file operations offered on tree entries.
    class Explorer
    {
    public:
        Explorer(asio::io_context &io, RemoteService &service, EventBus &events, Logger &logger,
                 TransferSettings settings = {});

        Explorer(const Explorer &) = delete;
        Explorer &operator=(const Explorer &) = delete;

        TreeStore &tree() noexcept { return tree_; }
        TransferCoordinator &transfers() noexcept { return transfers_; }
        ConflictResolver &conflicts() noexcept { return conflicts_; }
        Clipboard &clipboard() noexcept { return clipboard_; }

        void remove(const std::string &session_id, const protocol::FileEntry &entry, ResultHandler done = {});

        // context_entry is the entry the action was invoked on; the new entry goes into it when
        // it is a directory, next to it otherwise, and into the current directory without one.
        void create_file(const std::string &session_id, const std::optional<protocol::FileEntry> &context_entry,
                         const std::string &name, ResultHandler done = {});
        void create_directory(const std::string &session_id, const std::optional<protocol::FileEntry> &context_entry,
                              const std::string &name, ResultHandler done = {});

        void rename(const std::string &session_id, const protocol::FileEntry &entry, const std::string &new_name,
                    ResultHandler done = {});

        void change_permissions(const std::string &session_id, const protocol::FileEntry &entry,
                                const std::string &octal_text, ResultHandler done = {});

        // One upload action: a fresh batch for overwrite-all, the target reloaded once at least
        // one member completed.
        void upload(const std::string &session_id, const std::vector<std::filesystem::path> &local_files,
                    const std::string &target_directory, BatchHandler done = {});

        std::string download(const std::string &session_id, const std::string &remote_path,
                             const std::filesystem::path &local_path, CompletionHandler done = {});

    private:
        std::string parent_for_new_entry(const std::string &session_id,
                                         const std::optional<protocol::FileEntry> &context_entry) const;
        ResultHandler reload_after(const std::string &session_id, const std::string &directory,
                                   ResultHandler done);

        RemoteService &service_;
        Logger &logger_;
        TreeStore tree_;
        TransferCoordinator transfers_;
        ConflictResolver conflicts_;
        Clipboard clipboard_;
    };

} // namespace remotefs::client
