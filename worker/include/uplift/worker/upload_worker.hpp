/**
 * Uplift - Performs one upload session from start to a terminal state.
 *
 * The worker is the second writer of a session record. It reports every
 * transition through the state store, which is its only channel back to the
 * manager, and stops at the next checkpoint once a stop has been requested
 * (SIGTERM/SIGINT, request_stop(), or the record turning terminal under it).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "uplift/state_store.hpp"
#include "uplift/upload_session.hpp"
#include "uplift/worker/storage_backend.hpp"

namespace uplift::worker
{

    struct WorkerTask
    {
        std::string session_id;
        std::string source;
        SourceKind kind{SourceKind::File};
    };

    struct RetryPolicy
    {
        std::uint32_t max_attempts{3};
        // Delay before retry n (0-based) is base_delay * 2^n.
        std::chrono::milliseconds base_delay{std::chrono::seconds{1}};
    };

    struct WorkerOptions
    {
        RetryPolicy retry{};
        std::chrono::milliseconds heartbeat_interval{std::chrono::seconds{5}};
        std::filesystem::path temp_directory{std::filesystem::temp_directory_path()};
    };

    class UploadWorker
    {
    public:
        UploadWorker(WorkerTask task, StateStore &store, StorageBackend &backend, WorkerOptions options = {});

        UploadWorker(const UploadWorker &) = delete;
        UploadWorker &operator=(const UploadWorker &) = delete;

        // Runs the task to a terminal state and returns the status left in the store.
        UploadStatus run();

        void request_stop() noexcept { stop_requested_.store(true); }
        bool stop_requested() const noexcept;

        // Routes SIGTERM and SIGINT to every worker's stop flag.
        static void install_signal_handlers();

    private:
        void execute();
        std::filesystem::path temp_path_for_source() const;
        void download_source(const std::filesystem::path &destination);
        std::uint64_t validate_file_source() const;
        std::string upload_with_retry(const std::filesystem::path &artifact);

        void checkpoint(const char *where) const;
        void sleep_interruptibly(std::chrono::milliseconds delay) const;
        UploadSession record(const StateStore::Mutator &mutator);
        void finish_cancelled(const std::string &message);
        void finish_failed(const std::exception &error);

        WorkerTask task_;
        StateStore &store_;
        StorageBackend &backend_;
        WorkerOptions options_;
        std::atomic<bool> stop_requested_{false};
    };

} // namespace uplift::worker
