#include "remotefs/error_codes.hpp"

#include <array>

namespace remotefs
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 15> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidCommand, "invalid_command"},
            {ErrorCode::InvalidPayload, "invalid_payload"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::SessionNotFound, "session_not_found"},
            {ErrorCode::Conflict, "conflict"},
            {ErrorCode::Busy, "busy"},
            {ErrorCode::Skipped, "skipped"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::TransferFailed, "transfer_failed"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace remotefs
