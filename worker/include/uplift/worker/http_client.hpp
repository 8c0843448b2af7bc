/**
 * Uplift - Blocking HTTP requests on top of libcurl.
 *
 * Requests run on a private multi handle that is polled in short slices, so a
 * cancellation is noticed within one slice even while the peer is silent.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace uplift::worker
{

    // Polled during every network wait; returning true aborts the request.
    using CancelCheck = std::function<bool()>;

    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

    struct HttpRequest
    {
        std::string method{"GET"};
        std::string url;
        HttpHeaders headers{};
        std::string body{};
        // Streamed as the request body instead of `body` when set.
        std::optional<std::filesystem::path> body_file{};
    };

    struct HttpResponse
    {
        long status{};
        // Error bodies are always captured here (truncated); success bodies only when no sink is given.
        std::string body{};
        std::string final_url{};
        std::optional<std::uint64_t> content_length{};

        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    using BodySink = std::function<void(std::string_view chunk, const HttpResponse &head)>;

    class HttpClient
    {
    public:
        struct Options
        {
            // Connect timeout, and the longest stretch allowed without any transfer progress.
            std::chrono::milliseconds timeout{std::chrono::seconds{60}};
            long max_redirects{5};
            std::string user_agent{"uplift"};
        };

        explicit HttpClient(Options options, CancelCheck cancelled = {});

        HttpResponse send(const HttpRequest &request);

        // Streams a successful body into sink; redirects are followed for GET requests.
        HttpResponse send(const HttpRequest &request, const BodySink &sink);

    private:
        HttpResponse perform(const HttpRequest &request, const BodySink *sink);

        Options options_;
        CancelCheck cancelled_;
    };

} // namespace uplift::worker
