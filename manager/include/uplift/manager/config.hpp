#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace uplift::manager
{

    struct ManagerConfig
    {
        std::filesystem::path state_dir;
        std::filesystem::path worker_executable;
        std::optional<std::string> api_key;
        std::optional<std::string> storage_url;
        std::optional<std::size_t> max_active_uploads;
        std::chrono::seconds heartbeat_timeout{120};
        std::chrono::milliseconds terminate_grace{std::chrono::seconds{2}};
        std::optional<std::filesystem::path> log_file;
        spdlog::level::level_enum log_level{spdlog::level::warn};
    };

    struct CliInvocation
    {
        ManagerConfig config;
        bool serve{false};
        bool help{false};
        std::string tool;
        std::vector<std::string> tool_args;
    };

    // Flags win over UPLIFT_* environment variables, which win over built-in defaults.
    CliInvocation parse_arguments(int argc, char *argv[]);

    std::filesystem::path default_state_dir();
    std::filesystem::path default_worker_executable();

} // namespace uplift::manager
