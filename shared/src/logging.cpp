#include "uplift/logging.hpp"

#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace uplift
{

    void configure_logging(const std::string &name, const LoggingOptions &options)
    {
        std::vector<spdlog::sink_ptr> sinks;
        if (options.console)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        }
        if (options.file)
        {
            if (options.file->has_parent_path())
            {
                std::error_code ec;
                std::filesystem::create_directories(options.file->parent_path(), ec);
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), false));
        }
        if (sinks.empty())
        {
            sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
        }
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(options.level);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        logger->flush_on(spdlog::level::info);
        spdlog::set_default_logger(logger);
    }

    std::optional<spdlog::level::level_enum> parse_log_level(const std::string &value)
    {
        const auto level = spdlog::level::from_str(value);
        if (level == spdlog::level::off && value != "off")
        {
            return std::nullopt;
        }
        return level;
    }

} // namespace uplift
