/**
 * Uplift - Tool call envelopes and their mapping onto the upload manager.
 *
 * A call names a tool and carries its arguments as a JSON object; the reply
 * either holds the tool's result or an error code with a message. The same
 * envelopes serve the one-shot command line and the line-delimited --serve
 * loop.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "uplift/error_codes.hpp"
#include "uplift/manager/upload_manager.hpp"

namespace uplift::manager
{

    enum class Tool : std::uint8_t
    {
        UploadFile,
        UploadFromUrl,
        CheckUploadStatus,
        GetUploadResult,
        CancelUpload,
        ListUploads,
        CleanupOldUploads
    };

    std::string_view to_string(Tool tool) noexcept;
    std::optional<Tool> tool_from_string(std::string_view value) noexcept;

    struct ToolCall
    {
        std::string tool;
        nlohmann::json arguments{nlohmann::json::object()};
        nlohmann::json id{}; // echoed back verbatim; null when absent
    };

    void to_json(nlohmann::json &json, const ToolCall &call);
    void from_json(const nlohmann::json &json, ToolCall &call);

    struct ToolResponse
    {
        nlohmann::json id{};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json result{};

        bool ok() const noexcept { return error == ErrorCode::Ok; }
    };

    void to_json(nlohmann::json &json, const ToolResponse &response);

    // Public view of a session as returned by check_upload_status and list_uploads.
    nlohmann::json session_to_json(const UploadSession &session);

    class ToolDispatcher
    {
    public:
        explicit ToolDispatcher(UploadManager &manager);

        ToolResponse dispatch(const ToolCall &call);

        // Parses one line of the --serve protocol and dispatches it.
        ToolResponse handle_line(const std::string &line);

    private:
        nlohmann::json invoke(Tool tool, const nlohmann::json &arguments);

        UploadManager &manager_;
    };

    // Builds a call from command-line words, e.g. {"list_uploads", "--active"}.
    ToolCall make_tool_call(const std::string &tool, const std::vector<std::string> &args);

} // namespace uplift::manager
