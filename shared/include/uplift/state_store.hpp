/**
 * Uplift - File-backed store of upload session records.
 *
 * Each session lives in its own JSON document named after the session id.
 * Writes go to a temporary file that is renamed over the record, so a reader
 * in another process only ever sees a complete record. Read-modify-write
 * cycles are serialized across processes with an advisory lock per session.
 */
#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "uplift/upload_session.hpp"

namespace uplift
{

    class StateStore
    {
    public:
        struct Entry
        {
            std::string session_id;
            std::filesystem::path path;
            std::optional<UploadSession> session; // empty when the record failed to parse
        };

        using Mutator = std::function<void(UploadSession &)>;

        explicit StateStore(std::filesystem::path directory);

        const std::filesystem::path &directory() const noexcept { return directory_; }

        UploadSession put(const std::string &session_id, UploadSession session);

        std::optional<UploadSession> get(const std::string &session_id) const;

        // Applies the mutator to the stored record under the session lock. A record that
        // is already terminal is returned untouched.
        std::optional<UploadSession> update(const std::string &session_id, const Mutator &mutator);

        std::vector<UploadSession> list() const;

        std::vector<Entry> scan() const;

        void remove(const std::string &session_id);

        std::filesystem::path record_path(const std::string &session_id) const;

        static bool is_valid_session_id(std::string_view session_id) noexcept;

    private:
        std::filesystem::path lock_path(const std::string &session_id) const;
        void write_record(const std::string &session_id, const UploadSession &session) const;
        static std::optional<UploadSession> read_record(const std::filesystem::path &path,
                                                        std::string_view expected_id);

        std::filesystem::path directory_;
    };

} // namespace uplift
