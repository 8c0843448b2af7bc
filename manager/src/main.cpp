#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "uplift/logging.hpp"
#include "uplift/process_supervisor.hpp"
#include "uplift/state_store.hpp"
#include "uplift/version.hpp"
#include "uplift/manager/config.hpp"
#include "uplift/manager/tool_dispatcher.hpp"
#include "uplift/manager/upload_manager.hpp"
#include "uplift/manager/worker_launcher.hpp"

namespace
{

    constexpr int kExitToolError = 1;
    constexpr int kExitUsage = 2;

    void print_usage(const char *program_name)
    {
        std::cerr << "Uplift " << uplift::version() << "\n"
                  << "Usage: " << program_name << " [options] <tool> [args]\n"
                  << "       " << program_name << " [options] --serve\n\n"
                  << "Tools:\n"
                  << "  upload_file <path>\n"
                  << "  upload_from_url <url>\n"
                  << "  check_upload_status <session_id>\n"
                  << "  get_upload_result <session_id>\n"
                  << "  cancel_upload <session_id>\n"
                  << "  list_uploads [--active]\n"
                  << "  cleanup_old_uploads [hours]\n\n"
                  << "Options:\n"
                  << "  --state-dir <DIR>          session records (UPLIFT_STATE_DIR)\n"
                  << "  --worker <PATH>            worker executable (UPLIFT_WORKER)\n"
                  << "  --storage-url <URL>        upload initiation endpoint (UPLIFT_STORAGE_URL)\n"
                  << "  --max-active <N>           cap on active uploads (UPLIFT_MAX_ACTIVE)\n"
                  << "  --heartbeat-timeout <SEC>  0 disables (UPLIFT_HEARTBEAT_TIMEOUT)\n"
                  << "  --grace <MS>               wait before a cancelled worker is killed\n"
                  << "  --log <FILE>               also log to FILE\n"
                  << "  --log-level <LEVEL>\n";
    }

    int serve(uplift::manager::ToolDispatcher &dispatcher)
    {
        // A reader that goes away must not take the process down mid-write.
        std::signal(SIGPIPE, SIG_IGN);
        spdlog::info("Serving tool calls on stdin");

        std::string line;
        while (std::getline(std::cin, line))
        {
            if (line.find_first_not_of(" \t\r") == std::string::npos)
            {
                continue;
            }
            const auto response = dispatcher.handle_line(line);
            std::cout << nlohmann::json(response).dump() << std::endl;
            if (!std::cout)
            {
                spdlog::warn("Output stream closed, stopping");
                return kExitToolError;
            }
        }
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace uplift;

    manager::CliInvocation invocation;
    try
    {
        invocation = manager::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (invocation.help)
    {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    const auto &config = invocation.config;
    try
    {
        configure_logging("uplift", LoggingOptions{
                                        .console = true,
                                        .file = config.log_file,
                                        .level = config.log_level,
                                    });

        StateStore store(config.state_dir);
        manager::ProcessWorkerLauncher launcher(manager::ProcessWorkerLauncher::Options{
            .executable = config.worker_executable,
            .api_key = config.api_key,
            .storage_url = config.storage_url,
        });
        // Only processes running the worker binary count as a session's worker.
        ProcessSupervisor supervisor(config.worker_executable.filename().string(), config.terminate_grace);
        manager::UploadManager upload_manager(store, launcher, supervisor,
                                              manager::ManagerOptions{
                                                  .max_active_uploads = config.max_active_uploads,
                                                  .heartbeat_timeout = config.heartbeat_timeout,
                                              });
        manager::ToolDispatcher dispatcher(upload_manager);

        if (invocation.serve)
        {
            return serve(dispatcher);
        }

        manager::ToolResponse response;
        try
        {
            response = dispatcher.dispatch(manager::make_tool_call(invocation.tool, invocation.tool_args));
        }
        catch (const manager::ToolError &ex)
        {
            response.error = ex.code();
            response.message = ex.what();
        }
        std::cout << nlohmann::json(response).dump(2) << std::endl;
        return response.ok() ? EXIT_SUCCESS : kExitToolError;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return kExitToolError;
    }
}
