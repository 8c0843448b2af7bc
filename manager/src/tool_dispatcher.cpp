#include "uplift/manager/tool_dispatcher.hpp"

#include <array>
#include <chrono>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace uplift::manager
{

    namespace
    {

        struct ToolMapping
        {
            Tool tool;
            std::string_view label;
        };

        constexpr std::array<ToolMapping, 7> kToolMappings{{
            {Tool::UploadFile, "upload_file"},
            {Tool::UploadFromUrl, "upload_from_url"},
            {Tool::CheckUploadStatus, "check_upload_status"},
            {Tool::GetUploadResult, "get_upload_result"},
            {Tool::CancelUpload, "cancel_upload"},
            {Tool::ListUploads, "list_uploads"},
            {Tool::CleanupOldUploads, "cleanup_old_uploads"},
        }};

        constexpr long long kDefaultMaxAgeHours = 24;
        // Largest age whose conversion to seconds cannot overflow.
        constexpr long long kMaxAgeHoursLimit =
            std::chrono::duration_cast<std::chrono::hours>(std::chrono::seconds::max()).count();

        std::string required_string(const nlohmann::json &arguments, const char *name)
        {
            const auto it = arguments.find(name);
            if (it == arguments.end() || !it->is_string() || it->get_ref<const std::string &>().empty())
            {
                throw ToolError(ErrorCode::InvalidArguments, std::string("Missing string argument: ") + name);
            }
            return it->get<std::string>();
        }

        template <typename T>
        nlohmann::json optional_or_null(const std::optional<T> &value)
        {
            return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
        }

    } // namespace

    std::string_view to_string(Tool tool) noexcept
    {
        for (const auto &mapping : kToolMappings)
        {
            if (mapping.tool == tool)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<Tool> tool_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kToolMappings)
        {
            if (mapping.label == value)
            {
                return mapping.tool;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const ToolCall &call)
    {
        json = {
            {"tool", call.tool},
            {"arguments", call.arguments},
        };
        if (!call.id.is_null())
        {
            json["id"] = call.id;
        }
    }

    void from_json(const nlohmann::json &json, ToolCall &call)
    {
        call.tool = json.at("tool").get<std::string>();
        call.arguments = json.value("arguments", nlohmann::json::object());
        if (!call.arguments.is_object())
        {
            throw std::invalid_argument("\"arguments\" must be an object");
        }
        call.id = json.value("id", nlohmann::json{});
    }

    void to_json(nlohmann::json &json, const ToolResponse &response)
    {
        json = {
            {"id", response.id},
            {"ok", response.ok()},
            {"error", response.ok() ? nlohmann::json(nullptr) : nlohmann::json(to_string(response.error))},
            {"message", response.message},
            {"result", response.result},
        };
    }

    nlohmann::json session_to_json(const UploadSession &session)
    {
        return {
            {"session_id", session.session_id},
            {"source", session.source},
            {"source_kind", to_string(session.source_kind)},
            {"status", to_string(session.status)},
            {"progress", session.progress},
            {"size_bytes", session.size_bytes},
            {"error", optional_or_null(session.error)},
            {"error_kind", session.error_kind ? nlohmann::json(to_string(*session.error_kind)) : nlohmann::json(nullptr)},
            {"result_url", optional_or_null(session.result_url)},
            {"created_at", format_timestamp(session.created_at)},
            {"updated_at", format_timestamp(session.updated_at)},
            {"retry_count", session.retry_count},
            {"last_error", optional_or_null(session.last_error)},
        };
    }

    ToolDispatcher::ToolDispatcher(UploadManager &manager)
        : manager_(manager)
    {
    }

    ToolResponse ToolDispatcher::dispatch(const ToolCall &call)
    {
        ToolResponse response;
        response.id = call.id;

        const auto tool = tool_from_string(call.tool);
        if (!tool)
        {
            response.error = ErrorCode::UnknownTool;
            response.message = "Unknown tool: " + call.tool;
            return response;
        }

        spdlog::debug("Dispatching {}", call.tool);
        try
        {
            response.result = invoke(*tool, call.arguments);
        }
        catch (const ToolError &ex)
        {
            response.error = ex.code();
            response.message = ex.what();
        }
        catch (const nlohmann::json::exception &ex)
        {
            response.error = ErrorCode::InvalidArguments;
            response.message = ex.what();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed: {}", call.tool, ex.what());
            response.error = ErrorCode::InternalError;
            response.message = ex.what();
        }
        return response;
    }

    ToolResponse ToolDispatcher::handle_line(const std::string &line)
    {
        const auto json = nlohmann::json::parse(line, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            ToolResponse response;
            response.error = ErrorCode::InvalidArguments;
            response.message = "Expected one JSON object per line";
            return response;
        }

        ToolCall call;
        try
        {
            call = json.get<ToolCall>();
        }
        catch (const std::exception &ex)
        {
            ToolResponse response;
            response.id = json.value("id", nlohmann::json{});
            response.error = ErrorCode::InvalidArguments;
            response.message = ex.what();
            return response;
        }
        return dispatch(call);
    }

    nlohmann::json ToolDispatcher::invoke(Tool tool, const nlohmann::json &arguments)
    {
        switch (tool)
        {
        case Tool::UploadFile:
        case Tool::UploadFromUrl:
        {
            const bool is_file = tool == Tool::UploadFile;
            const auto source = required_string(arguments, is_file ? "file_path" : "url");
            const auto started = manager_.start_upload(source, is_file ? SourceKind::File : SourceKind::Url);
            return {
                {"session_id", started.session_id},
                {"status", "started"},
                {"size_bytes", started.size_bytes},
                {"estimated_duration", started.estimated_duration.count()},
            };
        }
        case Tool::CheckUploadStatus:
            return session_to_json(manager_.get_upload_status(required_string(arguments, "session_id")));
        case Tool::GetUploadResult:
        {
            const auto result = manager_.get_upload_result(required_string(arguments, "session_id"));
            return {
                {"session_id", result.session_id},
                {"url", result.url},
                {"size_bytes", result.size_bytes},
            };
        }
        case Tool::CancelUpload:
        {
            const auto session_id = required_string(arguments, "session_id");
            const auto outcome = manager_.cancel_upload(session_id);
            return {
                {"session_id", session_id},
                {"status", outcome == CancelOutcome::Cancelled ? "cancelled" : "already_finished"},
            };
        }
        case Tool::ListUploads:
        {
            const bool active_only = arguments.value("active_only", false);
            auto uploads = nlohmann::json::array();
            for (const auto &session : manager_.list_uploads(active_only))
            {
                uploads.push_back(session_to_json(session));
            }
            const auto total = uploads.size();
            return {
                {"uploads", std::move(uploads)},
                {"total_count", total},
                {"active_only", active_only},
            };
        }
        case Tool::CleanupOldUploads:
        {
            const auto hours = arguments.value("max_age_hours", kDefaultMaxAgeHours);
            if (hours < 0)
            {
                throw ToolError(ErrorCode::InvalidArguments, "max_age_hours must not be negative");
            }
            if (hours > kMaxAgeHoursLimit)
            {
                throw ToolError(ErrorCode::InvalidArguments,
                                "max_age_hours must not exceed " + std::to_string(kMaxAgeHoursLimit));
            }
            const auto cleaned = manager_.cleanup_old_uploads(std::chrono::hours(hours));
            return {
                {"cleaned_count", cleaned},
                {"max_age_hours", hours},
            };
        }
        }
        throw ToolError(ErrorCode::UnknownTool, "Unsupported tool: " + std::string(to_string(tool)));
    }

    ToolCall make_tool_call(const std::string &tool, const std::vector<std::string> &args)
    {
        ToolCall call;
        call.tool = tool;
        const auto parsed = tool_from_string(tool);
        if (!parsed)
        {
            return call;
        }

        const auto single = [&](const char *name)
        {
            if (args.size() != 1)
            {
                throw ToolError(ErrorCode::InvalidArguments, tool + " expects exactly one argument: <" + name + ">");
            }
            call.arguments[name] = args.front();
        };

        switch (*parsed)
        {
        case Tool::UploadFile:
            single("file_path");
            break;
        case Tool::UploadFromUrl:
            single("url");
            break;
        case Tool::CheckUploadStatus:
        case Tool::GetUploadResult:
        case Tool::CancelUpload:
            single("session_id");
            break;
        case Tool::ListUploads:
            if (args.size() > 1 || (args.size() == 1 && args.front() != "--active"))
            {
                throw ToolError(ErrorCode::InvalidArguments, "list_uploads accepts only --active");
            }
            call.arguments["active_only"] = !args.empty();
            break;
        case Tool::CleanupOldUploads:
            if (args.size() > 1)
            {
                throw ToolError(ErrorCode::InvalidArguments, "cleanup_old_uploads accepts at most one argument: [hours]");
            }
            if (!args.empty())
            {
                try
                {
                    std::size_t consumed = 0;
                    call.arguments["max_age_hours"] = std::stoll(args.front(), &consumed);
                    if (consumed != args.front().size())
                    {
                        throw std::invalid_argument(args.front());
                    }
                }
                catch (const std::logic_error &)
                {
                    throw ToolError(ErrorCode::InvalidArguments, "hours must be a whole number, got " + args.front());
                }
            }
            break;
        }
        return call;
    }

} // namespace uplift::manager
