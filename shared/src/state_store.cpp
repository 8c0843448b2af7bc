#include "uplift/state_store.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace uplift
{

    namespace
    {
        constexpr std::string_view kRecordPrefix = "upload_";
        constexpr std::string_view kRecordExtension = ".json";

        // Holds an exclusive flock() on a per-session lock file for its lifetime.
        class SessionLock
        {
        public:
            explicit SessionLock(const std::filesystem::path &path)
            {
                fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
                if (fd_ < 0)
                {
                    throw std::system_error(errno, std::generic_category(), "open lock " + path.string());
                }
                while (::flock(fd_, LOCK_EX) != 0)
                {
                    if (errno != EINTR)
                    {
                        const int error = errno;
                        ::close(fd_);
                        throw std::system_error(error, std::generic_category(), "flock " + path.string());
                    }
                }
            }

            ~SessionLock()
            {
                ::flock(fd_, LOCK_UN);
                ::close(fd_);
            }

            SessionLock(const SessionLock &) = delete;
            SessionLock &operator=(const SessionLock &) = delete;

        private:
            int fd_{-1};
        };

        // Timestamps are persisted with millisecond precision; keep them strictly increasing.
        Clock::time_point next_update_time(const std::optional<UploadSession> &previous)
        {
            auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
            if (previous)
            {
                const auto floor = std::chrono::time_point_cast<std::chrono::milliseconds>(previous->updated_at) +
                                   std::chrono::milliseconds{1};
                now = std::max(now, floor);
            }
            return now;
        }

        std::optional<std::string> session_id_from_filename(const std::filesystem::path &path)
        {
            const auto name = path.filename().string();
            if (name.size() <= kRecordExtension.size() || !name.starts_with(kRecordPrefix) ||
                !name.ends_with(kRecordExtension))
            {
                return std::nullopt;
            }
            return name.substr(0, name.size() - kRecordExtension.size());
        }

    } // namespace

    StateStore::StateStore(std::filesystem::path directory)
        : directory_(std::move(directory))
    {
        std::filesystem::create_directories(directory_);
    }

    UploadSession StateStore::put(const std::string &session_id, UploadSession session)
    {
        if (!is_valid_session_id(session_id))
        {
            throw std::invalid_argument("Invalid session id: " + session_id);
        }
        SessionLock lock(lock_path(session_id));
        session.session_id = session_id;
        session.updated_at = next_update_time(read_record(record_path(session_id), session_id));
        write_record(session_id, session);
        return session;
    }

    std::optional<UploadSession> StateStore::get(const std::string &session_id) const
    {
        if (!is_valid_session_id(session_id))
        {
            return std::nullopt;
        }
        return read_record(record_path(session_id), session_id);
    }

    std::optional<UploadSession> StateStore::update(const std::string &session_id, const Mutator &mutator)
    {
        if (!is_valid_session_id(session_id))
        {
            return std::nullopt;
        }
        SessionLock lock(lock_path(session_id));
        auto current = read_record(record_path(session_id), session_id);
        if (!current)
        {
            return std::nullopt;
        }
        if (current->terminal())
        {
            return current;
        }

        UploadSession next = *current;
        mutator(next);
        if (next.status != current->status && !can_transition(current->status, next.status))
        {
            spdlog::warn("Rejected transition {} -> {} for session {}", to_string(current->status),
                         to_string(next.status), session_id);
            return current;
        }
        next.session_id = session_id;
        next.created_at = current->created_at;
        if (!next.terminal())
        {
            next.progress = std::max(next.progress, current->progress);
        }
        next.progress = std::clamp(next.progress, 0.0, 1.0);
        next.updated_at = next_update_time(current);
        write_record(session_id, next);
        return next;
    }

    std::vector<UploadSession> StateStore::list() const
    {
        std::vector<UploadSession> sessions;
        for (auto &entry : scan())
        {
            if (entry.session)
            {
                sessions.push_back(std::move(*entry.session));
            }
        }
        return sessions;
    }

    std::vector<StateStore::Entry> StateStore::scan() const
    {
        std::vector<Entry> entries;
        std::error_code ec;
        std::filesystem::directory_iterator it(directory_, ec);
        if (ec)
        {
            spdlog::warn("Cannot enumerate state directory {}: {}", directory_.string(), ec.message());
            return entries;
        }
        for (const auto &item : it)
        {
            if (!item.is_regular_file(ec))
            {
                continue;
            }
            auto session_id = session_id_from_filename(item.path());
            if (!session_id)
            {
                continue;
            }
            auto session = read_record(item.path(), *session_id);
            if (!session)
            {
                spdlog::debug("Skipping unreadable session record {}", item.path().string());
            }
            entries.push_back(Entry{std::move(*session_id), item.path(), std::move(session)});
        }
        return entries;
    }

    void StateStore::remove(const std::string &session_id)
    {
        if (!is_valid_session_id(session_id))
        {
            return;
        }
        std::error_code ec;
        std::filesystem::remove(record_path(session_id), ec);
        if (ec)
        {
            throw std::system_error(ec, "remove " + record_path(session_id).string());
        }
        std::filesystem::remove(lock_path(session_id), ec);
    }

    std::filesystem::path StateStore::record_path(const std::string &session_id) const
    {
        return directory_ / (session_id + std::string(kRecordExtension));
    }

    bool StateStore::is_valid_session_id(std::string_view session_id) noexcept
    {
        if (session_id.empty() || session_id.size() > 128)
        {
            return false;
        }
        return std::all_of(session_id.begin(), session_id.end(), [](char ch)
                           { return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                                    (ch >= '0' && ch <= '9') || ch == '_' || ch == '-'; });
    }

    std::filesystem::path StateStore::lock_path(const std::string &session_id) const
    {
        return directory_ / (session_id + ".lock");
    }

    void StateStore::write_record(const std::string &session_id, const UploadSession &session) const
    {
        const auto final_path = record_path(session_id);
        auto temp_path = final_path;
        temp_path += ".tmp." + std::to_string(::getpid());

        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open state file for writing: " + temp_path.string());
            }
            out << nlohmann::json(session).dump(2);
            out.flush();
            if (!out)
            {
                std::error_code ignored;
                std::filesystem::remove(temp_path, ignored);
                throw std::runtime_error("Failed to write state file: " + temp_path.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(temp_path, final_path, ec);
        if (ec)
        {
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            throw std::system_error(ec, "rename " + temp_path.string());
        }
    }

    std::optional<UploadSession> StateStore::read_record(const std::filesystem::path &path,
                                                         std::string_view expected_id)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        const auto json = nlohmann::json::parse(in, nullptr, false);
        if (json.is_discarded() || !json.is_object())
        {
            return std::nullopt;
        }
        try
        {
            auto session = json.get<UploadSession>();
            if (session.session_id != expected_id)
            {
                return std::nullopt;
            }
            return session;
        }
        catch (const nlohmann::json::exception &)
        {
            return std::nullopt;
        }
        catch (const std::invalid_argument &)
        {
            return std::nullopt;
        }
    }

} // namespace uplift
