/**
 * Uplift - Front-end facing orchestrator for background uploads.
 *
 * The manager owns session creation and worker launch but never performs an
 * upload itself. Every query re-reads the state store; a worker that vanished
 * without reporting a terminal state is detected lazily on the next status
 * query and recorded as failed.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "uplift/error_codes.hpp"
#include "uplift/process_supervisor.hpp"
#include "uplift/state_store.hpp"
#include "uplift/upload_session.hpp"
#include "uplift/manager/worker_launcher.hpp"

namespace uplift::manager
{

    class ToolError : public std::runtime_error
    {
    public:
        ToolError(ErrorCode code, const std::string &message)
            : std::runtime_error(message),
              code_(code)
        {
        }

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    struct ManagerOptions
    {
        // Admission cap on non-terminal sessions; unset means unlimited.
        std::optional<std::size_t> max_active_uploads{};
        // A non-terminal record not refreshed for this long is treated as abandoned; 0 disables.
        std::chrono::seconds heartbeat_timeout{120};
    };

    struct StartedUpload
    {
        std::string session_id;
        std::uint64_t size_bytes{};
        std::chrono::seconds estimated_duration{};
    };

    struct UploadResult
    {
        std::string session_id;
        std::string url;
        std::uint64_t size_bytes{};
    };

    enum class CancelOutcome : std::uint8_t
    {
        Cancelled,
        AlreadyFinished
    };

    class UploadManager
    {
    public:
        UploadManager(StateStore &store, WorkerLauncher &launcher, const ProcessSupervisor &supervisor,
                      ManagerOptions options = {});

        StartedUpload start_upload(const std::string &source, SourceKind kind);

        UploadSession get_upload_status(const std::string &session_id);

        UploadResult get_upload_result(const std::string &session_id);

        CancelOutcome cancel_upload(const std::string &session_id);

        std::vector<UploadSession> list_uploads(bool active_only) const;

        // Returns how many records were deleted, corrupted ones included.
        std::size_t cleanup_old_uploads(std::chrono::seconds max_age);

        static std::chrono::seconds estimate_duration(std::uint64_t size_bytes) noexcept;
        static std::string generate_session_id();

    private:
        std::uint64_t validate_file(const std::string &source) const;
        static void validate_url(const std::string &source);
        void enforce_admission_cap() const;
        UploadSession load(const std::string &session_id) const;
        void remove_session_files(const std::string &session_id);

        StateStore &store_;
        WorkerLauncher &launcher_;
        const ProcessSupervisor &supervisor_;
        ManagerOptions options_;
    };

} // namespace uplift::manager
