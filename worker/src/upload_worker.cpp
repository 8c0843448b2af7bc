#include "uplift/worker/upload_worker.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <thread>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "uplift/crypto.hpp"
#include "uplift/worker/upload_error.hpp"

namespace uplift::worker
{

    namespace
    {
        constexpr auto kSleepSlice = std::chrono::milliseconds{100};
        constexpr double kDownloadStart = 0.1;
        constexpr double kDownloadEnd = 0.5;
        constexpr double kFileUploadStart = 0.1;
        constexpr double kProgressStep = 0.05;

        std::atomic<bool> g_signal_stop{false};
        static_assert(std::atomic<bool>::is_always_lock_free);

        void handle_stop_signal(int)
        {
            g_signal_stop.store(true);
        }

        std::string interruption_message()
        {
            return g_signal_stop.load() ? "upload interrupted by signal" : "upload stopped on request";
        }

        class ScopedTempFile
        {
        public:
            explicit ScopedTempFile(std::filesystem::path path)
                : path_(std::move(path))
            {
            }

            ~ScopedTempFile()
            {
                std::error_code ec;
                std::filesystem::remove(path_, ec);
                if (ec)
                {
                    spdlog::warn("Failed to remove temporary file {}: {}", path_.string(), ec.message());
                }
            }

            ScopedTempFile(const ScopedTempFile &) = delete;
            ScopedTempFile &operator=(const ScopedTempFile &) = delete;

            const std::filesystem::path &path() const noexcept { return path_; }

        private:
            std::filesystem::path path_;
        };

        // Refreshes updated_at on a fixed cadence so the manager can tell a live worker
        // from one that stopped making progress.
        class Heartbeat
        {
        public:
            Heartbeat(StateStore &store, std::string session_id, std::chrono::milliseconds interval)
            {
                if (interval.count() <= 0)
                {
                    return;
                }
                thread_ = std::jthread([&store, session_id = std::move(session_id), interval](std::stop_token stop)
                                       {
                    std::mutex mutex;
                    std::condition_variable_any wake;
                    std::unique_lock lock(mutex);
                    while (!wake.wait_for(lock, stop, interval, [] { return false; }) && !stop.stop_requested())
                    {
                        try
                        {
                            const auto stored = store.update(session_id, [](UploadSession &) {});
                            if (!stored || stored->terminal())
                            {
                                return;
                            }
                        }
                        catch (const std::exception &ex)
                        {
                            spdlog::warn("Heartbeat for {} failed: {}", session_id, ex.what());
                        }
                    } });
            }

        private:
            std::jthread thread_;
        };

        std::string source_suffix(const std::string &url)
        {
            auto path = url.substr(0, url.find_first_of("?#"));
            const auto scheme = path.find("://");
            if (scheme != std::string::npos)
            {
                const auto slash = path.find('/', scheme + 3);
                path = slash == std::string::npos ? std::string{} : path.substr(slash);
            }
            auto suffix = std::filesystem::path(path).extension().string();
            const bool safe = std::all_of(suffix.begin(), suffix.end(), [](unsigned char ch)
                                          { return std::isalnum(ch) || ch == '.'; });
            if (suffix.size() < 2 || suffix.size() > 16 || !safe)
            {
                return ".tmp";
            }
            return suffix;
        }

    } // namespace

    UploadWorker::UploadWorker(WorkerTask task, StateStore &store, StorageBackend &backend, WorkerOptions options)
        : task_(std::move(task)),
          store_(store),
          backend_(backend),
          options_(std::move(options))
    {
    }

    void UploadWorker::install_signal_handlers()
    {
        struct sigaction action
        {
        };
        action.sa_handler = handle_stop_signal;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        ::sigaction(SIGTERM, &action, nullptr);
        ::sigaction(SIGINT, &action, nullptr);
    }

    bool UploadWorker::stop_requested() const noexcept
    {
        return stop_requested_.load() || g_signal_stop.load();
    }

    UploadStatus UploadWorker::run()
    {
        spdlog::info("Worker {} starting session {} ({} {})", ::getpid(), task_.session_id, to_string(task_.kind),
                     task_.source);
        {
            Heartbeat heartbeat(store_, task_.session_id, options_.heartbeat_interval);
            try
            {
                execute();
            }
            catch (const UploadInterrupted &ex)
            {
                spdlog::info("Session {} stopped: {}", task_.session_id, ex.what());
                finish_cancelled(interruption_message());
            }
            catch (const std::exception &ex)
            {
                if (stop_requested())
                {
                    spdlog::info("Session {} stopped: {}", task_.session_id, ex.what());
                    finish_cancelled(interruption_message());
                }
                else
                {
                    finish_failed(ex);
                }
            }
        }

        const auto final_state = store_.get(task_.session_id);
        const auto status = final_state ? final_state->status : UploadStatus::Failed;
        spdlog::info("Worker for session {} finished with status {}", task_.session_id, to_string(status));
        return status;
    }

    void UploadWorker::execute()
    {
        record([](UploadSession &session)
               {
            session.progress = 0.0;
            session.worker_pid = static_cast<int>(::getpid()); });
        checkpoint("before starting");

        std::optional<ScopedTempFile> downloaded;
        std::filesystem::path artifact;
        if (task_.kind == SourceKind::Url)
        {
            downloaded.emplace(temp_path_for_source());
            download_source(downloaded->path());
            checkpoint("after download");
            const auto size = std::filesystem::file_size(downloaded->path());
            record([size](UploadSession &session)
                   {
                session.status = UploadStatus::Uploading;
                session.progress = kDownloadEnd;
                session.size_bytes = size; });
            artifact = downloaded->path();
        }
        else
        {
            const auto size = validate_file_source();
            record([size](UploadSession &session)
                   {
                session.status = UploadStatus::Uploading;
                session.progress = kFileUploadStart;
                session.size_bytes = size; });
            artifact = task_.source;
        }

        const auto content_hash = crypto::hash_file(artifact);
        record([&content_hash](UploadSession &session)
               { session.content_hash = content_hash; });

        const auto result_url = upload_with_retry(artifact);
        if (stop_requested())
        {
            throw UploadInterrupted("stop requested while the upload was in flight");
        }

        const auto completed = store_.update(task_.session_id, [&result_url](UploadSession &session)
                                             {
            session.status = UploadStatus::Completed;
            session.progress = 1.0;
            session.result_url = result_url;
            session.error.reset();
            session.error_kind.reset(); });
        if (!completed)
        {
            throw std::runtime_error("Session record " + task_.session_id + " disappeared");
        }
        if (completed->status != UploadStatus::Completed)
        {
            spdlog::info("Session {} was {} before the upload could be recorded", task_.session_id,
                         to_string(completed->status));
            return;
        }
        spdlog::info("Session {} completed: {}", task_.session_id, result_url);
    }

    std::filesystem::path UploadWorker::temp_path_for_source() const
    {
        std::filesystem::create_directories(options_.temp_directory);
        return options_.temp_directory /
               ("uplift-" + task_.session_id + "-" + crypto::random_hex(4) + source_suffix(task_.source));
    }

    void UploadWorker::download_source(const std::filesystem::path &destination)
    {
        record([](UploadSession &session)
               {
            session.status = UploadStatus::Downloading;
            session.progress = kDownloadStart; });

        double reported = kDownloadStart;
        backend_.fetch(
            task_.source, destination,
            [&](std::uint64_t received, std::optional<std::uint64_t> total)
            {
                if (!total || *total == 0)
                {
                    return;
                }
                const auto fraction = std::min(1.0, static_cast<double>(received) / static_cast<double>(*total));
                const auto progress = kDownloadStart + (kDownloadEnd - kDownloadStart) * fraction;
                if (progress - reported >= kProgressStep)
                {
                    reported = progress;
                    record([progress](UploadSession &session)
                           { session.progress = progress; });
                }
            },
            [this]
            { return stop_requested(); });
        spdlog::info("Downloaded {} to {}", task_.source, destination.string());
    }

    std::uint64_t UploadWorker::validate_file_source() const
    {
        const std::filesystem::path path(task_.source);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            throw UploadError(ErrorKind::FileNotFound, "File not found: " + path.string());
        }
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw UploadError(ErrorKind::FileNotFound, "File not found: " + path.string());
        }
        if (size > kMaxUploadBytes)
        {
            throw UploadError(ErrorKind::FileTooLarge, "File too large: " + std::to_string(size) + " bytes (max " +
                                                           std::to_string(kMaxUploadBytes) + ")");
        }
        return size;
    }

    std::string UploadWorker::upload_with_retry(const std::filesystem::path &artifact)
    {
        const auto attempts = std::max<std::uint32_t>(1, options_.retry.max_attempts);
        for (std::uint32_t attempt = 0;; ++attempt)
        {
            checkpoint("before upload attempt");
            try
            {
                return backend_.upload(artifact, [this]
                                       { return stop_requested(); });
            }
            catch (const UploadInterrupted &)
            {
                throw;
            }
            catch (const std::exception &ex)
            {
                const auto failed = attempt + 1;
                const auto delay = options_.retry.base_delay * (1LL << attempt);
                std::string message = "Upload attempt " + std::to_string(failed) + " failed: " + ex.what();
                spdlog::warn("Session {}: {}", task_.session_id, message);
                record([&message, failed](UploadSession &session)
                       {
                    session.retry_count = failed;
                    session.last_error = message; });
                if (failed >= attempts)
                {
                    throw;
                }
                sleep_interruptibly(delay);
            }
        }
    }

    void UploadWorker::checkpoint(const char *where) const
    {
        if (stop_requested())
        {
            throw UploadInterrupted(std::string("stop requested ") + where);
        }
    }

    void UploadWorker::sleep_interruptibly(std::chrono::milliseconds delay) const
    {
        const auto deadline = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < deadline)
        {
            checkpoint("during retry backoff");
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::clamp(remaining, std::chrono::milliseconds{0}, kSleepSlice));
        }
        checkpoint("during retry backoff");
    }

    UploadSession UploadWorker::record(const StateStore::Mutator &mutator)
    {
        const auto stored = store_.update(task_.session_id, mutator);
        if (!stored)
        {
            throw std::runtime_error("Session record " + task_.session_id + " is missing or unreadable");
        }
        if (stored->terminal())
        {
            request_stop();
            throw UploadInterrupted("session already " + std::string(to_string(stored->status)));
        }
        return *stored;
    }

    void UploadWorker::finish_cancelled(const std::string &message)
    {
        spdlog::info("Session {} cancelled: {}", task_.session_id, message);
        try
        {
            store_.update(task_.session_id, [&message](UploadSession &session)
                          { mark_cancelled(session, message); });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Could not record cancellation of {}: {}", task_.session_id, ex.what());
        }
    }

    void UploadWorker::finish_failed(const std::exception &error)
    {
        const auto kind = classify_error(error);
        spdlog::error("Upload failed [{}]: {}", to_string(kind), error.what());
        try
        {
            store_.update(task_.session_id, [&](UploadSession &session)
                          { mark_failed(session, error.what(), kind); });
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Could not record failure of {}: {}", task_.session_id, ex.what());
        }
    }

} // namespace uplift::worker
