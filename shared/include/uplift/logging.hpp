#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace uplift
{

    struct LoggingOptions
    {
        bool console{true};
        std::optional<std::filesystem::path> file;
        spdlog::level::level_enum level{spdlog::level::info};
    };

    // Installs the process-wide default logger. Console output goes to stderr so that
    // stdout stays reserved for tool responses.
    void configure_logging(const std::string &name, const LoggingOptions &options);

    std::optional<spdlog::level::level_enum> parse_log_level(const std::string &value);

} // namespace uplift
