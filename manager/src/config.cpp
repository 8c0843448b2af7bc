#include "uplift/manager/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

#include "uplift/logging.hpp"

namespace uplift::manager
{

    namespace
    {
        constexpr const char *kWorkerBinaryName = "uplift-worker";

        std::optional<std::string> environment(const char *name)
        {
            const char *value = std::getenv(name);
            if (value == nullptr || *value == '\0')
            {
                return std::nullopt;
            }
            return std::string(value);
        }

        std::string next_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

        long long parse_number(const std::string &value, const std::string &name)
        {
            std::size_t consumed = 0;
            long long number = 0;
            try
            {
                number = std::stoll(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(name + " expects a number, got " + value);
            }
            if (consumed != value.size() || number < 0)
            {
                throw std::runtime_error(name + " expects a non-negative number, got " + value);
            }
            return number;
        }

    } // namespace

    CliInvocation parse_arguments(int argc, char *argv[])
    {
        CliInvocation invocation;
        auto &config = invocation.config;

        std::optional<std::filesystem::path> state_dir;
        std::optional<std::filesystem::path> worker;
        std::optional<std::chrono::seconds> heartbeat_timeout;

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index];
            if (!arg.starts_with("--"))
            {
                break;
            }
            ++index;
            if (arg == "--state-dir")
            {
                state_dir = next_value(index, argc, argv, arg);
            }
            else if (arg == "--worker")
            {
                worker = next_value(index, argc, argv, arg);
            }
            else if (arg == "--storage-url")
            {
                config.storage_url = next_value(index, argc, argv, arg);
            }
            else if (arg == "--max-active")
            {
                config.max_active_uploads =
                    static_cast<std::size_t>(parse_number(next_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--heartbeat-timeout")
            {
                heartbeat_timeout = std::chrono::seconds(parse_number(next_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--grace")
            {
                config.terminate_grace =
                    std::chrono::milliseconds(parse_number(next_value(index, argc, argv, arg), arg));
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(next_value(index, argc, argv, arg));
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
            else if (arg == "--serve")
            {
                invocation.serve = true;
            }
            else if (arg == "--help")
            {
                invocation.help = true;
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        if (index < argc)
        {
            invocation.tool = argv[index++];
            while (index < argc)
            {
                invocation.tool_args.emplace_back(argv[index++]);
            }
        }
        if (!invocation.help && !invocation.serve && invocation.tool.empty())
        {
            throw std::runtime_error("Expected a tool name or --serve");
        }
        if (invocation.serve && !invocation.tool.empty())
        {
            throw std::runtime_error("--serve does not take a tool name");
        }

        if (!state_dir)
        {
            if (auto value = environment("UPLIFT_STATE_DIR"))
            {
                state_dir = *value;
            }
        }
        config.state_dir = state_dir ? *state_dir : default_state_dir();

        if (!worker)
        {
            if (auto value = environment("UPLIFT_WORKER"))
            {
                worker = *value;
            }
        }
        config.worker_executable = worker ? *worker : default_worker_executable();

        if (!config.storage_url)
        {
            config.storage_url = environment("UPLIFT_STORAGE_URL");
        }
        config.api_key = environment("UPLIFT_API_KEY");
        if (!config.max_active_uploads)
        {
            if (auto value = environment("UPLIFT_MAX_ACTIVE"))
            {
                config.max_active_uploads = static_cast<std::size_t>(parse_number(*value, "UPLIFT_MAX_ACTIVE"));
            }
        }
        if (!heartbeat_timeout)
        {
            if (auto value = environment("UPLIFT_HEARTBEAT_TIMEOUT"))
            {
                heartbeat_timeout = std::chrono::seconds(parse_number(*value, "UPLIFT_HEARTBEAT_TIMEOUT"));
            }
        }
        if (heartbeat_timeout)
        {
            config.heartbeat_timeout = *heartbeat_timeout;
        }

        return invocation;
    }

    std::filesystem::path default_state_dir()
    {
        if (auto home = environment("HOME"))
        {
            return std::filesystem::path(*home) / ".uplift" / "uploads";
        }
        return std::filesystem::temp_directory_path() / "uplift" / "uploads";
    }

    std::filesystem::path default_worker_executable()
    {
        std::error_code ec;
        const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        if (!ec)
        {
            const auto sibling = self.parent_path() / kWorkerBinaryName;
            if (std::filesystem::exists(sibling, ec))
            {
                return sibling;
            }
        }
        return kWorkerBinaryName;
    }

} // namespace uplift::manager
