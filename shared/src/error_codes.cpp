#include "uplift/error_codes.hpp"

#include <array>

namespace uplift
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArguments, "invalid_arguments"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::FileTooLarge, "file_too_large"},
            {ErrorCode::Busy, "busy"},
            {ErrorCode::NotCompleted, "not_completed"},
            {ErrorCode::UploadFailed, "upload_failed"},
            {ErrorCode::UploadCancelled, "upload_cancelled"},
            {ErrorCode::SpawnFailed, "spawn_failed"},
            {ErrorCode::UnknownTool, "unknown_tool"},
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

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.description == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace uplift
