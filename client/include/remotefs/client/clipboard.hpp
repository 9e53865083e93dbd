#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "remotefs/protocol.hpp"
#include "remotefs/remote_service.hpp"

namespace remotefs::client
{

    class Logger;
    class TreeStore;

    struct ClipboardEntry
    {
        std::string source_path;
        std::string source_name;
        bool is_directory{};
        bool is_cut{};
        std::string session_id;
    };

    enum class PasteOperation : std::uint8_t
    {
        None,
        Move,
        Copy
    };

    struct PastePlan
    {
        PasteOperation operation{PasteOperation::None};
        std::string destination_path;
        ErrorCode error{ErrorCode::Ok};
        std::string message;
    };

    // Decides what a paste of entry into destination_directory does. existing_names is the cached
    // listing of the destination, used to pick a free "copy_N_of_" name.
    PastePlan plan_paste(const ClipboardEntry &entry, const std::string &destination_directory,
                         const std::optional<std::set<std::string>> &existing_names);

    // Right-clicked directory when there is one, otherwise the current directory.
    std::string select_paste_target(const std::optional<protocol::FileEntry> &context_entry,
                                    const std::string &current_path);

    class Clipboard
    {
    public:
        Clipboard(RemoteService &service, TreeStore &tree, Logger &logger);

        void cut(const std::string &session_id, const protocol::FileEntry &entry);
        void copy(const std::string &session_id, const protocol::FileEntry &entry);
        void clear();

        const std::optional<ClipboardEntry> &entry() const noexcept { return entry_; }

        // The clipboard is empty afterwards whatever the outcome.
        void paste(const std::string &session_id, const std::string &destination_directory, ResultHandler done = {});

    private:
        void stage(const std::string &session_id, const protocol::FileEntry &entry, bool is_cut);

        RemoteService &service_;
        TreeStore &tree_;
        Logger &logger_;
        std::optional<ClipboardEntry> entry_;
    };

} // namespace remotefs::client
