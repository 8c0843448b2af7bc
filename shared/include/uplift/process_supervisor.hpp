/**
 * Uplift - Liveness checks, termination and detached launch of worker processes.
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace uplift
{

    struct SpawnRequest
    {
        std::vector<std::string> argv;
        // Extra variables layered over the launcher's environment.
        std::vector<std::pair<std::string, std::string>> environment;
        std::optional<std::filesystem::path> log_path;
    };

    // Starts argv[0] in a new session, re-parented away from the caller. Returns the
    // pid of the exec'd process; throws std::system_error when fork/exec fails.
    int spawn_detached(const SpawnRequest &request);

    class ProcessSupervisor
    {
    public:
        explicit ProcessSupervisor(std::string expected_marker = {},
                                   std::chrono::milliseconds grace_period = std::chrono::seconds{2});

        bool is_alive(int pid) const;

        // SIGTERM, then SIGKILL once the grace period lapses. Returns true if the
        // process had to be force-killed.
        bool terminate(int pid) const;

        std::chrono::milliseconds grace_period() const noexcept { return grace_period_; }

    private:
        std::string expected_marker_;
        std::chrono::milliseconds grace_period_;
    };

} // namespace uplift
