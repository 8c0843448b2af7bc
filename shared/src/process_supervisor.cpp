#include "uplift/process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

extern char **environ;

namespace uplift
{

    namespace
    {
        constexpr auto kPollInterval = std::chrono::milliseconds{100};
        constexpr auto kKillSettleTime = std::chrono::seconds{1};

        class Pipe
        {
        public:
            Pipe()
            {
                if (::pipe2(fds_, O_CLOEXEC) != 0)
                {
                    throw std::system_error(errno, std::generic_category(), "pipe2");
                }
            }

            ~Pipe()
            {
                close_read();
                close_write();
            }

            Pipe(const Pipe &) = delete;
            Pipe &operator=(const Pipe &) = delete;

            int read_end() const noexcept { return fds_[0]; }
            int write_end() const noexcept { return fds_[1]; }

            void close_read() noexcept
            {
                if (fds_[0] >= 0)
                {
                    ::close(fds_[0]);
                    fds_[0] = -1;
                }
            }

            void close_write() noexcept
            {
                if (fds_[1] >= 0)
                {
                    ::close(fds_[1]);
                    fds_[1] = -1;
                }
            }

        private:
            int fds_[2]{-1, -1};
        };

        // Reads exactly sizeof(T) bytes; false on EOF before any byte arrived.
        template <typename T>
        bool read_value(int fd, T &value)
        {
            auto *out = reinterpret_cast<char *>(&value);
            std::size_t total = 0;
            while (total < sizeof(T))
            {
                const auto n = ::read(fd, out + total, sizeof(T) - total);
                if (n < 0 && errno == EINTR)
                {
                    continue;
                }
                if (n <= 0)
                {
                    return false;
                }
                total += static_cast<std::size_t>(n);
            }
            return true;
        }

        template <typename T>
        void write_value(int fd, const T &value) noexcept
        {
            const auto *in = reinterpret_cast<const char *>(&value);
            std::size_t total = 0;
            while (total < sizeof(T))
            {
                const auto n = ::write(fd, in + total, sizeof(T) - total);
                if (n < 0 && errno == EINTR)
                {
                    continue;
                }
                if (n <= 0)
                {
                    return;
                }
                total += static_cast<std::size_t>(n);
            }
        }

        std::vector<std::string> merged_environment(const SpawnRequest &request)
        {
            std::vector<std::string> result;
            for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry)
            {
                const std::string variable(*entry);
                const auto name = variable.substr(0, variable.find('='));
                const bool overridden = std::any_of(request.environment.begin(), request.environment.end(),
                                                    [&](const auto &item)
                                                    { return item.first == name; });
                if (!overridden)
                {
                    result.push_back(variable);
                }
            }
            for (const auto &[name, value] : request.environment)
            {
                result.push_back(name + "=" + value);
            }
            return result;
        }

        std::vector<char *> as_c_array(std::vector<std::string> &values)
        {
            std::vector<char *> pointers;
            pointers.reserve(values.size() + 1);
            for (auto &value : values)
            {
                pointers.push_back(value.data());
            }
            pointers.push_back(nullptr);
            return pointers;
        }

        // Runs in the forked grandchild only; must not return.
        [[noreturn]] void exec_worker(char *const *argv, char **envp, const char *log_path, int exec_status_fd)
        {
            sigset_t all;
            sigemptyset(&all);
            ::sigprocmask(SIG_SETMASK, &all, nullptr);
            ::signal(SIGTERM, SIG_DFL);
            ::signal(SIGINT, SIG_DFL);
            ::signal(SIGHUP, SIG_IGN);

            const int null_fd = ::open("/dev/null", O_RDWR);
            if (null_fd >= 0)
            {
                ::dup2(null_fd, STDIN_FILENO);
            }
            int out_fd = null_fd;
            if (log_path != nullptr)
            {
                const int log_fd = ::open(log_path, O_WRONLY | O_CREAT | O_APPEND, 0644);
                if (log_fd >= 0)
                {
                    out_fd = log_fd;
                }
            }
            if (out_fd >= 0)
            {
                ::dup2(out_fd, STDOUT_FILENO);
                ::dup2(out_fd, STDERR_FILENO);
            }

            environ = envp;
            ::execvp(argv[0], argv);
            const int error = errno;
            write_value(exec_status_fd, error);
            ::_exit(127);
        }

        std::optional<char> process_state(int pid)
        {
            std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
            if (!in.is_open())
            {
                return std::nullopt;
            }
            const std::string stat((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            const auto paren = stat.rfind(')');
            if (paren == std::string::npos || paren + 2 >= stat.size())
            {
                return std::nullopt;
            }
            return stat[paren + 2];
        }

        std::optional<std::string> process_command_line(int pid)
        {
            std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
            if (!in.is_open())
            {
                return std::nullopt;
            }
            std::string cmdline((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
            if (cmdline.empty())
            {
                return std::nullopt;
            }
            std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
            return cmdline;
        }

    } // namespace

    int spawn_detached(const SpawnRequest &request)
    {
        if (request.argv.empty())
        {
            throw std::invalid_argument("spawn_detached requires a program");
        }

        // Everything the children touch is prepared before fork().
        auto arguments = request.argv;
        auto argv = as_c_array(arguments);
        auto environment = merged_environment(request);
        auto envp = as_c_array(environment);
        const std::string log_path = request.log_path ? request.log_path->string() : std::string{};

        Pipe pid_pipe;
        Pipe exec_pipe;

        const pid_t child = ::fork();
        if (child < 0)
        {
            throw std::system_error(errno, std::generic_category(), "fork");
        }
        if (child == 0)
        {
            pid_pipe.close_read();
            exec_pipe.close_read();
            ::setsid();
            const pid_t grandchild = ::fork();
            if (grandchild < 0)
            {
                const int error = errno;
                write_value(pid_pipe.write_end(), pid_t{-1});
                write_value(pid_pipe.write_end(), error);
                ::_exit(1);
            }
            if (grandchild > 0)
            {
                write_value(pid_pipe.write_end(), grandchild);
                ::_exit(0);
            }
            pid_pipe.close_write();
            exec_worker(argv.data(), envp.data(), log_path.empty() ? nullptr : log_path.c_str(),
                        exec_pipe.write_end());
        }

        pid_pipe.close_write();
        exec_pipe.close_write();

        int wait_status = 0;
        while (::waitpid(child, &wait_status, 0) < 0 && errno == EINTR)
        {
        }

        pid_t worker_pid = -1;
        if (!read_value(pid_pipe.read_end(), worker_pid))
        {
            throw std::runtime_error("Launcher exited before reporting the worker pid");
        }
        if (worker_pid < 0)
        {
            int error = 0;
            read_value(pid_pipe.read_end(), error);
            throw std::system_error(error, std::generic_category(), "fork worker");
        }

        int exec_error = 0;
        if (read_value(exec_pipe.read_end(), exec_error))
        {
            throw std::system_error(exec_error, std::generic_category(), "exec " + request.argv.front());
        }

        spdlog::debug("Spawned detached process {} ({})", worker_pid, request.argv.front());
        return static_cast<int>(worker_pid);
    }

    ProcessSupervisor::ProcessSupervisor(std::string expected_marker, std::chrono::milliseconds grace_period)
        : expected_marker_(std::move(expected_marker)),
          grace_period_(grace_period)
    {
    }

    bool ProcessSupervisor::is_alive(int pid) const
    {
        if (pid <= 0)
        {
            return false;
        }
        if (::kill(pid, 0) != 0 && errno != EPERM)
        {
            return false;
        }
        if (const auto state = process_state(pid); state && (*state == 'Z' || *state == 'X'))
        {
            return false;
        }
        if (expected_marker_.empty())
        {
            return true;
        }
        // Without /proc the identity check is skipped and existence is trusted.
        const auto cmdline = process_command_line(pid);
        if (!cmdline)
        {
            return true;
        }
        return cmdline->find(expected_marker_) != std::string::npos;
    }

    bool ProcessSupervisor::terminate(int pid) const
    {
        if (!is_alive(pid))
        {
            return false;
        }
        if (::kill(pid, SIGTERM) != 0)
        {
            if (errno == ESRCH)
            {
                return false;
            }
            throw std::system_error(errno, std::generic_category(), "kill SIGTERM " + std::to_string(pid));
        }

        const auto deadline = std::chrono::steady_clock::now() + grace_period_;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (!is_alive(pid))
            {
                return false;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
        if (!is_alive(pid))
        {
            return false;
        }

        spdlog::warn("Process {} ignored SIGTERM for {} ms, sending SIGKILL", pid, grace_period_.count());
        if (::kill(pid, SIGKILL) != 0 && errno != ESRCH)
        {
            throw std::system_error(errno, std::generic_category(), "kill SIGKILL " + std::to_string(pid));
        }
        const auto settle_deadline = std::chrono::steady_clock::now() + kKillSettleTime;
        while (is_alive(pid) && std::chrono::steady_clock::now() < settle_deadline)
        {
            std::this_thread::sleep_for(kPollInterval / 10);
        }
        return true;
    }

} // namespace uplift
