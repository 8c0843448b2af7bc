#include "uplift/worker/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include "uplift/logging.hpp"

namespace uplift::worker
{

    namespace
    {

        std::string next_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        std::chrono::seconds parse_seconds(const std::string &value, const std::string &flag)
        {
            try
            {
                return std::chrono::seconds(std::stoll(value));
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(flag + " expects a number of seconds, got " + value);
            }
        }

    } // namespace

    WorkerConfig parse_arguments(int argc, char *argv[])
    {
        WorkerConfig config;
        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--session-id")
            {
                config.session_id = next_value(index, argc, argv, arg);
            }
            else if (arg == "--source")
            {
                config.source = next_value(index, argc, argv, arg);
            }
            else if (arg == "--kind")
            {
                const auto value = next_value(index, argc, argv, arg);
                const auto kind = source_kind_from_string(value);
                if (!kind)
                {
                    throw std::runtime_error("--kind must be file or url, got " + value);
                }
                config.kind = *kind;
            }
            else if (arg == "--state-dir")
            {
                config.state_dir = next_value(index, argc, argv, arg);
            }
            else if (arg == "--storage-url")
            {
                config.initiate_url = next_value(index, argc, argv, arg);
            }
            else if (arg == "--timeout")
            {
                config.request_timeout = parse_seconds(next_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--heartbeat")
            {
                config.heartbeat_interval = parse_seconds(next_value(index, argc, argv, arg), arg);
            }
            else if (arg == "--log-level")
            {
                const auto value = next_value(index, argc, argv, arg);
                const auto level = parse_log_level(value);
                if (!level)
                {
                    throw std::runtime_error("Unknown log level: " + value);
                }
                config.log_level = *level;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (config.session_id.empty() || config.source.empty() || config.state_dir.empty())
        {
            throw std::runtime_error("--session-id, --source and --state-dir are required");
        }
        if (!config.initiate_url)
        {
            if (const char *url = std::getenv("UPLIFT_STORAGE_URL"); url != nullptr && *url != '\0')
            {
                config.initiate_url = url;
            }
        }
        if (const char *key = std::getenv("UPLIFT_API_KEY"))
        {
            config.api_key = key;
        }
        return config;
    }

} // namespace uplift::worker
