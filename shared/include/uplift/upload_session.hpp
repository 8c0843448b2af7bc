/**
 * Uplift - Upload session record shared by the manager and its workers.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace uplift
{

    using Clock = std::chrono::system_clock;

    // Local files above this size are rejected before a worker is spawned.
    constexpr std::uint64_t kMaxUploadBytes = 10ULL * 1024 * 1024;

    enum class SourceKind : std::uint8_t
    {
        File,
        Url
    };

    std::string_view to_string(SourceKind kind) noexcept;
    std::optional<SourceKind> source_kind_from_string(std::string_view value) noexcept;

    enum class UploadStatus : std::uint8_t
    {
        Starting,
        Downloading,
        Uploading,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(UploadStatus status) noexcept;
    std::optional<UploadStatus> upload_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(UploadStatus status) noexcept
    {
        return status == UploadStatus::Completed || status == UploadStatus::Failed ||
               status == UploadStatus::Cancelled;
    }

    // Forward-only state machine; any non-terminal state may be cancelled or failed.
    bool can_transition(UploadStatus from, UploadStatus to) noexcept;

    enum class ErrorKind : std::uint8_t
    {
        Timeout,
        Network,
        FileNotFound,
        FileTooLarge,
        Unknown,
        WorkerDied,
        SpawnFailed,
        Cancelled
    };

    std::string_view to_string(ErrorKind kind) noexcept;
    std::optional<ErrorKind> error_kind_from_string(std::string_view value) noexcept;

    struct UploadSession
    {
        std::string session_id;
        std::string source;
        SourceKind source_kind{SourceKind::File};
        std::uint64_t size_bytes{};
        UploadStatus status{UploadStatus::Starting};
        double progress{};
        Clock::time_point created_at{};
        Clock::time_point updated_at{};
        std::optional<std::string> error{};
        std::optional<ErrorKind> error_kind{};
        std::optional<std::string> result_url{};
        std::optional<int> worker_pid{};
        std::uint32_t retry_count{};
        std::optional<std::string> last_error{};
        std::optional<std::string> content_hash{};

        bool terminal() const noexcept { return is_terminal(status); }
    };

    void to_json(nlohmann::json &json, const UploadSession &session);
    void from_json(const nlohmann::json &json, UploadSession &session);

    // Moves the session to a terminal failure/cancellation, keeping result_url absent.
    void mark_failed(UploadSession &session, std::string message, ErrorKind kind);
    void mark_cancelled(UploadSession &session, std::string message);

    // ISO-8601 UTC with millisecond precision, e.g. 2025-03-01T12:00:00.250Z.
    std::string format_timestamp(Clock::time_point time);
    Clock::time_point parse_timestamp(std::string_view text);

} // namespace uplift
