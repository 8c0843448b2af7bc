#include "uplift/upload_session.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace uplift
{

    namespace
    {

        struct SourceKindMapping
        {
            SourceKind kind;
            std::string_view label;
        };

        constexpr std::array<SourceKindMapping, 2> kSourceKindMappings{{
            {SourceKind::File, "file"},
            {SourceKind::Url, "url"},
        }};

        struct StatusMapping
        {
            UploadStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 6> kStatusMappings{{
            {UploadStatus::Starting, "starting"},
            {UploadStatus::Downloading, "downloading"},
            {UploadStatus::Uploading, "uploading"},
            {UploadStatus::Completed, "completed"},
            {UploadStatus::Failed, "failed"},
            {UploadStatus::Cancelled, "cancelled"},
        }};

        struct ErrorKindMapping
        {
            ErrorKind kind;
            std::string_view label;
        };

        constexpr std::array<ErrorKindMapping, 8> kErrorKindMappings{{
            {ErrorKind::Timeout, "timeout"},
            {ErrorKind::Network, "network"},
            {ErrorKind::FileNotFound, "file_not_found"},
            {ErrorKind::FileTooLarge, "file_too_large"},
            {ErrorKind::Unknown, "unknown"},
            {ErrorKind::WorkerDied, "worker_died"},
            {ErrorKind::SpawnFailed, "spawn_failed"},
            {ErrorKind::Cancelled, "cancelled"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || !it->is_string())
            {
                return std::nullopt;
            }
            return it->get<std::string>();
        }

        std::string required_label(const nlohmann::json &json, const char *key)
        {
            return json.at(key).get<std::string>();
        }

    } // namespace

    std::string_view to_string(SourceKind kind) noexcept
    {
        for (const auto &mapping : kSourceKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<SourceKind> source_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kSourceKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(UploadStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(ErrorKind kind) noexcept
    {
        for (const auto &mapping : kErrorKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<ErrorKind> error_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kErrorKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    bool can_transition(UploadStatus from, UploadStatus to) noexcept
    {
        if (is_terminal(from))
        {
            return false;
        }
        switch (to)
        {
        case UploadStatus::Starting:
            return false;
        case UploadStatus::Downloading:
            return from == UploadStatus::Starting;
        case UploadStatus::Uploading:
            return from == UploadStatus::Starting || from == UploadStatus::Downloading;
        case UploadStatus::Completed:
            return from == UploadStatus::Uploading;
        case UploadStatus::Failed:
        case UploadStatus::Cancelled:
            return true;
        }
        return false;
    }

    void to_json(nlohmann::json &json, const UploadSession &session)
    {
        json = nlohmann::json{
            {"session_id", session.session_id},
            {"source", session.source},
            {"source_kind", to_string(session.source_kind)},
            {"size_bytes", session.size_bytes},
            {"status", to_string(session.status)},
            {"progress", session.progress},
            {"created_at", format_timestamp(session.created_at)},
            {"updated_at", format_timestamp(session.updated_at)},
            {"retry_count", session.retry_count},
        };
        if (session.error)
        {
            json["error"] = *session.error;
        }
        if (session.error_kind)
        {
            json["error_kind"] = to_string(*session.error_kind);
        }
        if (session.result_url)
        {
            json["result_url"] = *session.result_url;
        }
        if (session.worker_pid)
        {
            json["worker_pid"] = *session.worker_pid;
        }
        if (session.last_error)
        {
            json["last_error"] = *session.last_error;
        }
        if (session.content_hash)
        {
            json["content_hash"] = *session.content_hash;
        }
    }

    void from_json(const nlohmann::json &json, UploadSession &session)
    {
        session.session_id = json.at("session_id").get<std::string>();
        session.source = json.at("source").get<std::string>();

        const auto kind_label = required_label(json, "source_kind");
        const auto kind = source_kind_from_string(kind_label);
        if (!kind)
        {
            throw std::invalid_argument("Unknown source kind: " + kind_label);
        }
        session.source_kind = *kind;

        const auto status_label = required_label(json, "status");
        const auto status = upload_status_from_string(status_label);
        if (!status)
        {
            throw std::invalid_argument("Unknown upload status: " + status_label);
        }
        session.status = *status;

        session.created_at = parse_timestamp(json.at("created_at").get<std::string>());
        session.updated_at = parse_timestamp(json.at("updated_at").get<std::string>());
        session.size_bytes = json.value("size_bytes", 0ULL);
        session.progress = json.value("progress", 0.0);
        session.retry_count = json.value("retry_count", 0U);

        session.error = optional_string(json, "error");
        session.error_kind.reset();
        if (const auto label = optional_string(json, "error_kind"))
        {
            session.error_kind = error_kind_from_string(*label).value_or(ErrorKind::Unknown);
        }
        session.result_url = optional_string(json, "result_url");
        session.worker_pid.reset();
        if (const auto it = json.find("worker_pid"); it != json.end() && it->is_number_integer())
        {
            session.worker_pid = it->get<int>();
        }
        session.last_error = optional_string(json, "last_error");
        session.content_hash = optional_string(json, "content_hash");
    }

    void mark_failed(UploadSession &session, std::string message, ErrorKind kind)
    {
        session.status = UploadStatus::Failed;
        session.error = std::move(message);
        session.error_kind = kind;
        session.result_url.reset();
    }

    void mark_cancelled(UploadSession &session, std::string message)
    {
        session.status = UploadStatus::Cancelled;
        session.error = std::move(message);
        session.error_kind = ErrorKind::Cancelled;
        session.result_url.reset();
    }

    std::string format_timestamp(Clock::time_point time)
    {
        const auto since_epoch = time.time_since_epoch();
        const auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - seconds).count();
        const std::time_t raw = static_cast<std::time_t>(seconds.count());
        std::tm utc{};
        gmtime_r(&raw, &utc);
        std::array<char, 40> buffer{};
        std::snprintf(buffer.data(), buffer.size(), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                      utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(millis));
        return buffer.data();
    }

    Clock::time_point parse_timestamp(std::string_view text)
    {
        const std::string value(text);
        std::tm utc{};
        int consumed = 0;
        if (std::sscanf(value.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                        &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &consumed) != 6)
        {
            throw std::invalid_argument("Malformed timestamp: " + value);
        }
        utc.tm_year -= 1900;
        utc.tm_mon -= 1;

        std::size_t index = static_cast<std::size_t>(consumed);
        std::chrono::microseconds fraction{0};
        if (index < value.size() && value[index] == '.')
        {
            ++index;
            long long micros = 0;
            int digits = 0;
            while (index < value.size() && std::isdigit(static_cast<unsigned char>(value[index])))
            {
                if (digits < 6)
                {
                    micros = micros * 10 + (value[index] - '0');
                    ++digits;
                }
                ++index;
            }
            for (; digits < 6; ++digits)
            {
                micros *= 10;
            }
            fraction = std::chrono::microseconds{micros};
        }
        const auto suffix = value.substr(index);
        if (!suffix.empty() && suffix != "Z" && suffix != "+00:00")
        {
            throw std::invalid_argument("Timestamp is not UTC: " + value);
        }

        const auto seconds = timegm(&utc);
        if (seconds == static_cast<std::time_t>(-1))
        {
            throw std::invalid_argument("Timestamp out of range: " + value);
        }
        return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::seconds{seconds} + fraction)};
    }

} // namespace uplift
