/**
 * RemoteFS - Shared data model and JSON serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace remotefs::protocol
{

    inline constexpr std::string_view kTransferProgressEvent = "transfer-progress";
    inline constexpr std::string_view kFileConflictEvent = "file-conflict";

    inline constexpr std::string_view kSkippedByUser = "Skipped by user";
    inline constexpr std::string_view kCancelledByUser = "Cancelled by user";

    enum class TransferKind : std::uint8_t
    {
        Upload,
        Download,
        Copy,
        Move
    };

    std::string_view to_string(TransferKind kind) noexcept;
    std::optional<TransferKind> transfer_kind_from_string(std::string_view value) noexcept;

    enum class TransferStatus : std::uint8_t
    {
        Pending,
        Transferring,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(TransferStatus status) noexcept;
    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(TransferStatus status) noexcept
    {
        return status == TransferStatus::Completed || status == TransferStatus::Failed ||
               status == TransferStatus::Cancelled;
    }

    enum class ConflictResolution : std::uint8_t
    {
        Overwrite,
        Skip,
        Cancel
    };

    std::string_view to_string(ConflictResolution resolution) noexcept;
    std::optional<ConflictResolution> conflict_resolution_from_string(std::string_view value) noexcept;

    enum class SortField : std::uint8_t
    {
        Name,
        Modified
    };

    std::string_view to_string(SortField field) noexcept;
    std::optional<SortField> sort_field_from_string(std::string_view value) noexcept;

    enum class SortDirection : std::uint8_t
    {
        Ascending,
        Descending
    };

    std::string_view to_string(SortDirection direction) noexcept;

    struct FileEntry
    {
        std::string name;
        std::string path;
        bool is_directory{};
        bool is_symlink{};
        bool symlink_target_is_directory{};
        std::optional<std::string> symlink_target{};
        std::uint64_t size{};
        std::uint64_t modified_time{};
        std::optional<std::uint32_t> permission_bits{};
        std::optional<std::vector<FileEntry>> children{};
        bool expanded{};
        bool loading{};

        // Directories and symlinks that resolve to a directory can be expanded.
        bool is_directory_like() const noexcept
        {
            return is_directory || (is_symlink && symlink_target_is_directory);
        }
    };

    void to_json(nlohmann::json &json, const FileEntry &entry);
    void from_json(const nlohmann::json &json, FileEntry &entry);

    struct SortState
    {
        SortField field{SortField::Name};
        SortDirection direction{SortDirection::Ascending};
    };

    void to_json(nlohmann::json &json, const SortState &sort);
    void from_json(const nlohmann::json &json, SortState &sort);

    struct SessionTreeState
    {
        std::vector<FileEntry> root_entries;
        std::string current_path{"/"};
        SortState sort{};
        bool loading{};
    };

    void to_json(nlohmann::json &json, const SessionTreeState &state);

    struct TransferTask
    {
        std::string task_id;
        TransferKind kind{TransferKind::Upload};
        std::string session_id;
        std::string file_name;
        std::string source_path;
        std::string destination_path;
        std::uint64_t total_bytes{};
        std::uint64_t transferred_bytes{};
        double speed_bytes_per_second{};
        std::optional<std::uint64_t> eta_seconds{};
        TransferStatus status{TransferStatus::Pending};
        std::optional<std::string> error{};
    };

    void to_json(nlohmann::json &json, const TransferTask &task);
    void from_json(const nlohmann::json &json, TransferTask &task);

    struct FileConflict
    {
        std::string task_id;
        std::string session_id;
        std::string file_path;
        std::optional<std::uint64_t> local_size{};
        std::optional<std::uint64_t> remote_size{};
        std::optional<std::uint64_t> local_modified{};
        std::optional<std::uint64_t> remote_modified{};
    };

    void to_json(nlohmann::json &json, const FileConflict &conflict);
    void from_json(const nlohmann::json &json, FileConflict &conflict);

    struct EventEnvelope
    {
        std::string event;
        nlohmann::json payload{nlohmann::json::object()};
    };

    void to_json(nlohmann::json &json, const EventEnvelope &envelope);
    void from_json(const nlohmann::json &json, EventEnvelope &envelope);

    EventEnvelope make_progress_event(const TransferTask &task);
    EventEnvelope make_conflict_event(const FileConflict &conflict);

} // namespace remotefs::protocol
