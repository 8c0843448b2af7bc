#include <cstdlib>
#include <exception>
#include <iostream>

#include <spdlog/spdlog.h>

#include "uplift/logging.hpp"
#include "uplift/state_store.hpp"
#include "uplift/version.hpp"
#include "uplift/worker/config.hpp"
#include "uplift/worker/storage_backend.hpp"
#include "uplift/worker/upload_worker.hpp"

namespace
{

    constexpr int kExitFailed = 1;
    constexpr int kExitUsage = 2;

    void print_usage(const char *program_name)
    {
        std::cerr << "Uplift upload worker " << uplift::version() << "\n"
                  << "Usage: " << program_name
                  << " --session-id <ID> --source <PATH|URL> --kind <file|url> --state-dir <DIR> "
                     "[--storage-url <URL>] [--timeout <seconds>] [--heartbeat <seconds>] [--log-level <LEVEL>]\n";
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace uplift;

    worker::WorkerConfig config;
    try
    {
        config = worker::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return kExitUsage;
    }

    // Installed before anything slow so that an early cancel is not lost.
    worker::UploadWorker::install_signal_handlers();

    try
    {
        configure_logging("worker", LoggingOptions{
                                        .console = false,
                                        .file = config.state_dir / "logs" / (config.session_id + ".log"),
                                        .level = config.log_level,
                                    });

        StateStore store(config.state_dir);

        worker::HttpStorageOptions storage;
        if (config.initiate_url)
        {
            storage.initiate_url = *config.initiate_url;
        }
        storage.api_key = config.api_key;
        storage.http.timeout = config.request_timeout;
        storage.http.user_agent = "uplift-worker/" + std::string(version());
        worker::HttpStorageBackend backend(std::move(storage));

        worker::WorkerOptions options;
        options.heartbeat_interval = config.heartbeat_interval;

        worker::UploadWorker upload_worker(
            worker::WorkerTask{.session_id = config.session_id, .source = config.source, .kind = config.kind},
            store, backend, options);
        const auto status = upload_worker.run();
        spdlog::shutdown();
        return status == UploadStatus::Failed ? kExitFailed : EXIT_SUCCESS;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Worker failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return kExitFailed;
    }
}
