#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

#include "uplift/upload_session.hpp"

namespace uplift::worker
{

    struct WorkerConfig
    {
        std::string session_id;
        std::string source;
        SourceKind kind{SourceKind::File};
        std::filesystem::path state_dir;
        std::optional<std::string> initiate_url;
        std::string api_key;
        std::chrono::seconds request_timeout{60};
        std::chrono::seconds heartbeat_interval{5};
        spdlog::level::level_enum log_level{spdlog::level::info};
    };

    // API key and storage endpoint fall back to UPLIFT_API_KEY / UPLIFT_STORAGE_URL.
    WorkerConfig parse_arguments(int argc, char *argv[]);

} // namespace uplift::worker
