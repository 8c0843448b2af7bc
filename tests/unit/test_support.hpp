#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include "uplift/worker/storage_backend.hpp"

namespace uplift::testing
{

    // Creates a fresh directory under the system temp dir and removes it on destruction.
    class TempDir
    {
    public:
        explicit TempDir(const std::string &name);
        ~TempDir();

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    // In-process storage backend; behaviour is scripted per test.
    class FakeBackend : public worker::StorageBackend
    {
    public:
        using UploadHandler = std::function<std::string(const std::filesystem::path &, const worker::CancelCheck &)>;
        using FetchHandler = std::function<void(const std::string &, const std::filesystem::path &,
                                                const worker::FetchProgress &, const worker::CancelCheck &)>;

        std::string upload(const std::filesystem::path &file, const worker::CancelCheck &cancelled) override;

        void fetch(const std::string &url, const std::filesystem::path &destination,
                   const worker::FetchProgress &progress, const worker::CancelCheck &cancelled) override;

        UploadHandler on_upload;
        FetchHandler on_fetch;
        int upload_calls{0};
        std::vector<std::filesystem::path> uploaded;
    };

    struct CapturedRequest
    {
        std::string method;
        std::string target;
        std::map<std::string, std::string> headers; // lower-cased names
        std::string body;
    };

    std::string http_response(int status, const std::string &reason, const std::string &body,
                              const std::string &extra_headers = {});

    // Serves one scripted response per accepted connection on 127.0.0.1, in order.
    class LoopbackServer
    {
    public:
        using Handler = std::function<std::string(const CapturedRequest &)>;

        explicit LoopbackServer(std::vector<Handler> handlers);
        ~LoopbackServer();

        LoopbackServer(const LoopbackServer &) = delete;
        LoopbackServer &operator=(const LoopbackServer &) = delete;

        std::string base_url() const;

        const std::vector<CapturedRequest> &requests() const noexcept { return requests_; }

    private:
        void serve();

        asio::io_context io_;
        asio::ip::tcp::acceptor acceptor_;
        std::vector<Handler> handlers_;
        std::vector<CapturedRequest> requests_;
        std::thread thread_;
    };

    void write_file(const std::filesystem::path &path, const std::string &contents);

    // Creates a sparse file of the given size.
    void make_file_of_size(const std::filesystem::path &path, std::uintmax_t size);

    std::string read_file(const std::filesystem::path &path);

    // Polls predicate until it holds or the timeout lapses; returns the last result.
    bool wait_until(const std::function<bool()> &predicate,
                    std::chrono::milliseconds timeout = std::chrono::seconds{10});

    // Reaps a forked child so that it does not linger as a zombie.
    void reap(int pid);

} // namespace uplift::testing
