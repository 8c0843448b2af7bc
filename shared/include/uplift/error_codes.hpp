/**
 * Uplift - Error codes reported to tool callers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace uplift
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArguments = 1,
        NotFound = 2,
        FileTooLarge = 3,
        Busy = 4,
        NotCompleted = 5,
        UploadFailed = 6,
        UploadCancelled = 7,
        SpawnFailed = 8,
        UnknownTool = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

} // namespace uplift
