#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "uplift/upload_session.hpp"

namespace uplift::manager
{

    struct WorkerInvocation
    {
        std::string session_id;
        std::string source;
        SourceKind kind{SourceKind::File};
        std::filesystem::path state_dir;
    };

    class WorkerLauncher
    {
    public:
        virtual ~WorkerLauncher() = default;

        // Starts a worker that outlives the caller and returns its pid.
        virtual int launch(const WorkerInvocation &invocation) = 0;
    };

    class ProcessWorkerLauncher : public WorkerLauncher
    {
    public:
        struct Options
        {
            std::filesystem::path executable;
            std::optional<std::string> api_key;
            std::optional<std::string> storage_url;
        };

        explicit ProcessWorkerLauncher(Options options);

        int launch(const WorkerInvocation &invocation) override;

    private:
        Options options_;
    };

    std::filesystem::path worker_log_path(const std::filesystem::path &state_dir, const std::string &session_id);

} // namespace uplift::manager
