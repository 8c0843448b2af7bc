#include "uplift/manager/upload_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#include "uplift/crypto.hpp"

namespace uplift::manager
{

    namespace
    {
        constexpr std::uint64_t kBytesPerEstimatedSecond = 512 * 1024;
        constexpr std::chrono::seconds kMinimumEstimate{10};

        const char *const kWorkerDied = "worker died unexpectedly";
        const char *const kCancelledByCaller = "cancelled by caller";

    } // namespace

    UploadManager::UploadManager(StateStore &store, WorkerLauncher &launcher, const ProcessSupervisor &supervisor,
                                 ManagerOptions options)
        : store_(store),
          launcher_(launcher),
          supervisor_(supervisor),
          options_(std::move(options))
    {
    }

    StartedUpload UploadManager::start_upload(const std::string &source, SourceKind kind)
    {
        UploadSession session{};
        if (kind == SourceKind::File)
        {
            session.size_bytes = validate_file(source);
            std::error_code ec;
            auto absolute = std::filesystem::absolute(source, ec);
            session.source = ec ? source : absolute.lexically_normal().string();
        }
        else
        {
            validate_url(source);
            session.source = source;
        }
        enforce_admission_cap();

        const auto session_id = generate_session_id();
        session.source_kind = kind;
        session.status = UploadStatus::Starting;
        session.progress = 0.0;
        session.created_at = Clock::now();
        store_.put(session_id, session);

        int pid = 0;
        try
        {
            pid = launcher_.launch(WorkerInvocation{
                .session_id = session_id,
                .source = session.source,
                .kind = kind,
                .state_dir = store_.directory(),
            });
        }
        catch (const std::exception &ex)
        {
            const std::string message = std::string("Failed to start upload process: ") + ex.what();
            spdlog::error("Session {}: {}", session_id, message);
            store_.update(session_id, [&message](UploadSession &record)
                          { mark_failed(record, message, ErrorKind::SpawnFailed); });
            throw ToolError(ErrorCode::SpawnFailed, message);
        }

        // The worker may already have advanced the record; only the pid is filled in here.
        const auto stored = store_.update(session_id, [pid](UploadSession &record)
                                          { record.worker_pid = pid; });
        if (!stored)
        {
            spdlog::warn("Session {} vanished right after its worker {} was launched", session_id, pid);
        }

        spdlog::info("Started session {} for {} {} (worker {})", session_id, to_string(kind), session.source, pid);
        return StartedUpload{
            .session_id = session_id,
            .size_bytes = session.size_bytes,
            .estimated_duration = estimate_duration(session.size_bytes),
        };
    }

    UploadSession UploadManager::get_upload_status(const std::string &session_id)
    {
        auto session = load(session_id);
        if (session.terminal())
        {
            return session;
        }

        std::optional<std::string> reason;
        if (session.worker_pid && !supervisor_.is_alive(*session.worker_pid))
        {
            reason = kWorkerDied;
        }
        else if (options_.heartbeat_timeout.count() > 0 &&
                 Clock::now() - session.updated_at > options_.heartbeat_timeout)
        {
            reason = "worker heartbeat expired after " + std::to_string(options_.heartbeat_timeout.count()) + "s";
        }
        if (!reason)
        {
            return session;
        }

        // update() leaves a record the worker finished in the meantime untouched.
        const auto reconciled = store_.update(session_id, [&reason](UploadSession &record)
                                              { mark_failed(record, *reason, ErrorKind::WorkerDied); });
        if (!reconciled)
        {
            throw ToolError(ErrorCode::NotFound, "Upload session not found: " + session_id);
        }
        if (reconciled->status == UploadStatus::Failed && reconciled->error_kind == ErrorKind::WorkerDied)
        {
            spdlog::warn("Session {} reconciled to failed: {}", session_id, *reason);
        }
        return *reconciled;
    }

    UploadResult UploadManager::get_upload_result(const std::string &session_id)
    {
        const auto session = get_upload_status(session_id);
        switch (session.status)
        {
        case UploadStatus::Completed:
            return UploadResult{
                .session_id = session_id,
                .url = session.result_url.value_or(std::string{}),
                .size_bytes = session.size_bytes,
            };
        case UploadStatus::Failed:
            throw ToolError(ErrorCode::UploadFailed, "Upload failed: " + session.error.value_or("unknown error"));
        case UploadStatus::Cancelled:
            throw ToolError(ErrorCode::UploadCancelled,
                            "Upload was cancelled: " + session.error.value_or(kCancelledByCaller));
        default:
            throw ToolError(ErrorCode::NotCompleted,
                            "Upload not completed yet. Status: " + std::string(to_string(session.status)));
        }
    }

    CancelOutcome UploadManager::cancel_upload(const std::string &session_id)
    {
        const auto session = load(session_id);
        if (session.terminal())
        {
            return CancelOutcome::AlreadyFinished;
        }

        // Recording the cancellation first means a worker that wins a race against the
        // signal finds a terminal record and cannot report completion afterwards.
        const auto cancelled = store_.update(session_id, [](UploadSession &record)
                                             { mark_cancelled(record, kCancelledByCaller); });
        if (!cancelled)
        {
            throw ToolError(ErrorCode::NotFound, "Upload session not found: " + session_id);
        }
        if (cancelled->status != UploadStatus::Cancelled)
        {
            return CancelOutcome::AlreadyFinished;
        }
        if (cancelled->error != kCancelledByCaller)
        {
            return CancelOutcome::AlreadyFinished;
        }

        if (const auto pid = cancelled->worker_pid.has_value() ? cancelled->worker_pid : session.worker_pid)
        {
            try
            {
                if (supervisor_.terminate(*pid))
                {
                    spdlog::warn("Worker {} for session {} had to be killed", *pid, session_id);
                }
            }
            catch (const std::system_error &ex)
            {
                spdlog::warn("Could not terminate worker {} for session {}: {}", *pid, session_id, ex.what());
            }
        }
        spdlog::info("Session {} cancelled", session_id);
        return CancelOutcome::Cancelled;
    }

    std::vector<UploadSession> UploadManager::list_uploads(bool active_only) const
    {
        auto sessions = store_.list();
        if (active_only)
        {
            sessions.erase(std::remove_if(sessions.begin(), sessions.end(), [](const UploadSession &session)
                                          { return session.terminal(); }),
                           sessions.end());
        }
        std::sort(sessions.begin(), sessions.end(), [](const UploadSession &lhs, const UploadSession &rhs)
                  { return lhs.created_at > rhs.created_at; });
        return sessions;
    }

    std::size_t UploadManager::cleanup_old_uploads(std::chrono::seconds max_age)
    {
        if (max_age.count() < 0)
        {
            throw ToolError(ErrorCode::InvalidArguments, "Maximum age must not be negative");
        }
        // Ages reaching back past the epoch cover no record; only corrupted ones are removed then.
        const auto now = Clock::now();
        std::optional<Clock::time_point> cutoff;
        if (max_age <= std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()))
        {
            cutoff = now - std::chrono::duration_cast<Clock::duration>(max_age);
        }

        std::size_t cleaned = 0;
        for (const auto &entry : store_.scan())
        {
            const bool corrupted = !entry.session.has_value();
            const bool expired =
                !corrupted && cutoff && entry.session->terminal() && entry.session->created_at <= *cutoff;
            if (!corrupted && !expired)
            {
                continue;
            }
            try
            {
                remove_session_files(entry.session_id);
                ++cleaned;
                spdlog::info("Removed {} session record {}", corrupted ? "corrupted" : "expired", entry.session_id);
            }
            catch (const std::system_error &ex)
            {
                spdlog::warn("Failed to remove session {}: {}", entry.session_id, ex.what());
            }
        }
        return cleaned;
    }

    std::chrono::seconds UploadManager::estimate_duration(std::uint64_t size_bytes) noexcept
    {
        const auto estimate = std::chrono::seconds(static_cast<std::int64_t>(size_bytes / kBytesPerEstimatedSecond));
        return std::max(kMinimumEstimate, estimate);
    }

    std::string UploadManager::generate_session_id()
    {
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(Clock::now().time_since_epoch()).count();
        return "upload_" + crypto::random_hex(4) + "_" + std::to_string(now);
    }

    std::uint64_t UploadManager::validate_file(const std::string &source) const
    {
        const std::filesystem::path path(source);
        std::error_code ec;
        if (source.empty() || !std::filesystem::exists(path, ec))
        {
            throw ToolError(ErrorCode::NotFound, "File not found: " + source);
        }
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw ToolError(ErrorCode::InvalidArguments, "Not a regular file: " + source);
        }
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw ToolError(ErrorCode::InvalidArguments, "Cannot read size of " + source + ": " + ec.message());
        }
        if (size > kMaxUploadBytes)
        {
            throw ToolError(ErrorCode::FileTooLarge,
                            "File too large: " + std::to_string(size) + " bytes (max 10MB)");
        }
        return size;
    }

    void UploadManager::validate_url(const std::string &source)
    {
        const bool http = source.starts_with("http://");
        const bool https = source.starts_with("https://");
        const auto host_begin = http ? 7U : 8U;
        if ((!http && !https) || source.size() <= host_begin || source[host_begin] == '/')
        {
            throw ToolError(ErrorCode::InvalidArguments, "Expected an http:// or https:// URL, got: " + source);
        }
    }

    void UploadManager::enforce_admission_cap() const
    {
        if (!options_.max_active_uploads)
        {
            return;
        }
        const auto active = list_uploads(true).size();
        if (active >= *options_.max_active_uploads)
        {
            throw ToolError(ErrorCode::Busy, "Too many active uploads (" + std::to_string(active) + "), try again later");
        }
    }

    UploadSession UploadManager::load(const std::string &session_id) const
    {
        auto session = store_.get(session_id);
        if (!session)
        {
            throw ToolError(ErrorCode::NotFound, "Upload session not found: " + session_id);
        }
        return *session;
    }

    void UploadManager::remove_session_files(const std::string &session_id)
    {
        store_.remove(session_id);
        std::error_code ec;
        std::filesystem::remove(worker_log_path(store_.directory(), session_id), ec);
    }

} // namespace uplift::manager
