#include "remotefs/protocol.hpp"

#include <array>
#include <stdexcept>

namespace remotefs::protocol
{

    namespace
    {

        struct TransferKindMapping
        {
            TransferKind kind;
            std::string_view label;
        };

        constexpr std::array<TransferKindMapping, 4> kTransferKindMappings{{
            {TransferKind::Upload, "upload"},
            {TransferKind::Download, "download"},
            {TransferKind::Copy, "copy"},
            {TransferKind::Move, "move"},
        }};

        struct TransferStatusMapping
        {
            TransferStatus status;
            std::string_view label;
        };

        constexpr std::array<TransferStatusMapping, 5> kTransferStatusMappings{{
            {TransferStatus::Pending, "pending"},
            {TransferStatus::Transferring, "transferring"},
            {TransferStatus::Completed, "completed"},
            {TransferStatus::Failed, "failed"},
            {TransferStatus::Cancelled, "cancelled"},
        }};

        struct ResolutionMapping
        {
            ConflictResolution resolution;
            std::string_view label;
        };

        constexpr std::array<ResolutionMapping, 3> kResolutionMappings{{
            {ConflictResolution::Overwrite, "overwrite"},
            {ConflictResolution::Skip, "skip"},
            {ConflictResolution::Cancel, "cancel"},
        }};

        struct SortFieldMapping
        {
            SortField field;
            std::string_view label;
        };

        constexpr std::array<SortFieldMapping, 2> kSortFieldMappings{{
            {SortField::Name, "name"},
            {SortField::Modified, "modified"},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        template <typename T>
        std::optional<T> get_optional(const nlohmann::json &json, const char *key)
        {
            auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return std::nullopt;
            }
            return it->get<T>();
        }

    } // namespace

    std::string_view to_string(TransferKind kind) noexcept
    {
        for (const auto &mapping : kTransferKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferKind> transfer_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kTransferKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(TransferStatus status) noexcept
    {
        for (const auto &mapping : kTransferStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<TransferStatus> transfer_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kTransferStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ConflictResolution resolution) noexcept
    {
        for (const auto &mapping : kResolutionMappings)
        {
            if (mapping.resolution == resolution)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ConflictResolution> conflict_resolution_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kResolutionMappings)
        {
            if (mapping.label == value)
            {
                return mapping.resolution;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(SortField field) noexcept
    {
        for (const auto &mapping : kSortFieldMappings)
        {
            if (mapping.field == field)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<SortField> sort_field_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kSortFieldMappings)
        {
            if (mapping.label == value)
            {
                return mapping.field;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(SortDirection direction) noexcept
    {
        return direction == SortDirection::Ascending ? "asc" : "desc";
    }

    void to_json(nlohmann::json &json, const FileEntry &entry)
    {
        json = {
            {"name", entry.name},
            {"path", entry.path},
            {"is_dir", entry.is_directory},
            {"is_symlink", entry.is_symlink},
            {"size", entry.size},
            {"modified", entry.modified_time},
            {"expanded", entry.expanded},
            {"loading", entry.loading},
        };
        if (entry.is_symlink)
        {
            json["target_is_dir"] = entry.symlink_target_is_directory;
        }
        put_optional(json, "link_target", entry.symlink_target);
        put_optional(json, "permissions", entry.permission_bits);
        if (entry.children)
        {
            json["children"] = *entry.children;
        }
    }

    void from_json(const nlohmann::json &json, FileEntry &entry)
    {
        entry.name = json.at("name").get<std::string>();
        entry.path = json.at("path").get<std::string>();
        entry.is_directory = json.value("is_dir", false);
        entry.is_symlink = json.value("is_symlink", false);
        entry.symlink_target_is_directory = json.value("target_is_dir", false);
        entry.symlink_target = get_optional<std::string>(json, "link_target");
        entry.size = json.value("size", 0ULL);
        entry.modified_time = json.value("modified", 0ULL);
        entry.permission_bits = get_optional<std::uint32_t>(json, "permissions");
        entry.expanded = json.value("expanded", false);
        entry.loading = json.value("loading", false);
        entry.children = get_optional<std::vector<FileEntry>>(json, "children");
    }

    void to_json(nlohmann::json &json, const SortState &sort)
    {
        json = {
            {"field", to_string(sort.field)},
            {"direction", to_string(sort.direction)},
        };
    }

    void from_json(const nlohmann::json &json, SortState &sort)
    {
        const auto field_label = json.value("field", std::string{"name"});
        auto field = sort_field_from_string(field_label);
        if (!field)
        {
            throw std::runtime_error("Unknown sort field: " + field_label);
        }
        sort.field = *field;
        sort.direction = json.value("direction", std::string{"asc"}) == "desc" ? SortDirection::Descending
                                                                             : SortDirection::Ascending;
    }

    void to_json(nlohmann::json &json, const SessionTreeState &state)
    {
        json = {
            {"root", state.root_entries},
            {"current_path", state.current_path},
            {"sort", state.sort},
            {"loading", state.loading},
        };
    }

    void to_json(nlohmann::json &json, const TransferTask &task)
    {
        json = {
            {"task_id", task.task_id},
            {"type", to_string(task.kind)},
            {"session_id", task.session_id},
            {"file_name", task.file_name},
            {"source", task.source_path},
            {"destination", task.destination_path},
            {"total_bytes", task.total_bytes},
            {"transferred_bytes", task.transferred_bytes},
            {"speed", task.speed_bytes_per_second},
            {"status", to_string(task.status)},
        };
        put_optional(json, "eta", task.eta_seconds);
        put_optional(json, "error", task.error);
    }

    void from_json(const nlohmann::json &json, TransferTask &task)
    {
        task.task_id = json.at("task_id").get<std::string>();
        const auto kind_label = json.at("type").get<std::string>();
        auto kind = transfer_kind_from_string(kind_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown transfer type: " + kind_label);
        }
        task.kind = *kind;
        const auto status_label = json.at("status").get<std::string>();
        auto status = transfer_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown transfer status: " + status_label);
        }
        task.status = *status;
        task.session_id = json.value("session_id", std::string{});
        task.file_name = json.value("file_name", std::string{});
        task.source_path = json.value("source", std::string{});
        task.destination_path = json.value("destination", std::string{});
        task.total_bytes = json.value("total_bytes", 0ULL);
        task.transferred_bytes = json.value("transferred_bytes", 0ULL);
        task.speed_bytes_per_second = json.value("speed", 0.0);
        task.eta_seconds = get_optional<std::uint64_t>(json, "eta");
        task.error = get_optional<std::string>(json, "error");
    }

    void to_json(nlohmann::json &json, const FileConflict &conflict)
    {
        json = {
            {"task_id", conflict.task_id},
            {"session_id", conflict.session_id},
            {"file_path", conflict.file_path},
        };
        put_optional(json, "local_size", conflict.local_size);
        put_optional(json, "remote_size", conflict.remote_size);
        put_optional(json, "local_modified", conflict.local_modified);
        put_optional(json, "remote_modified", conflict.remote_modified);
    }

    void from_json(const nlohmann::json &json, FileConflict &conflict)
    {
        conflict.task_id = json.at("task_id").get<std::string>();
        conflict.session_id = json.value("session_id", std::string{});
        conflict.file_path = json.at("file_path").get<std::string>();
        conflict.local_size = get_optional<std::uint64_t>(json, "local_size");
        conflict.remote_size = get_optional<std::uint64_t>(json, "remote_size");
        conflict.local_modified = get_optional<std::uint64_t>(json, "local_modified");
        conflict.remote_modified = get_optional<std::uint64_t>(json, "remote_modified");
    }

    void to_json(nlohmann::json &json, const EventEnvelope &envelope)
    {
        json = {
            {"event", envelope.event},
            {"payload", envelope.payload},
        };
    }

    void from_json(const nlohmann::json &json, EventEnvelope &envelope)
    {
        envelope.event = json.at("event").get<std::string>();
        envelope.payload = json.value("payload", nlohmann::json::object());
    }

    EventEnvelope make_progress_event(const TransferTask &task)
    {
        return EventEnvelope{
            .event = std::string(kTransferProgressEvent),
            .payload = task,
        };
    }

    EventEnvelope make_conflict_event(const FileConflict &conflict)
    {
        return EventEnvelope{
            .event = std::string(kFileConflictEvent),
            .payload = conflict,
        };
    }

} // namespace remotefs::protocol
