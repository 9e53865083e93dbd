/**
 * RemoteFS - Shared error codes used by the explorer engine and remote services.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace remotefs
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidCommand = 1,
        InvalidPayload = 2,
        PermissionDenied = 3,
        NotFound = 4,
        AlreadyExists = 5,
        SessionNotFound = 6,
        Conflict = 7,
        Busy = 8,
        Skipped = 9,
        Cancelled = 10,
        TransferFailed = 11,
        Unsupported = 12,
        Timeout = 13,
        InternalError = 14
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace remotefs
