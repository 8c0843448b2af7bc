#include "uplift/manager/worker_launcher.hpp"

#include <system_error>

#include <spdlog/spdlog.h>

#include "uplift/process_supervisor.hpp"

namespace uplift::manager
{

    ProcessWorkerLauncher::ProcessWorkerLauncher(Options options)
        : options_(std::move(options))
    {
    }

    int ProcessWorkerLauncher::launch(const WorkerInvocation &invocation)
    {
        const auto log_path = worker_log_path(invocation.state_dir, invocation.session_id);
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);

        SpawnRequest request;
        request.argv = {
            options_.executable.string(),
            "--session-id", invocation.session_id,
            "--source", invocation.source,
            "--kind", std::string(to_string(invocation.kind)),
            "--state-dir", invocation.state_dir.string(),
        };
        // The key travels in the environment so it never shows up in the process list.
        if (options_.api_key)
        {
            request.environment.emplace_back("UPLIFT_API_KEY", *options_.api_key);
        }
        if (options_.storage_url)
        {
            request.environment.emplace_back("UPLIFT_STORAGE_URL", *options_.storage_url);
        }
        request.log_path = log_path;

        const auto pid = spawn_detached(request);
        spdlog::info("Launched worker {} for session {}", pid, invocation.session_id);
        return pid;
    }

    std::filesystem::path worker_log_path(const std::filesystem::path &state_dir, const std::string &session_id)
    {
        return state_dir / "logs" / (session_id + ".log");
    }

} // namespace uplift::manager
