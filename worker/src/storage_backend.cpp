#include "uplift/worker/storage_backend.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "uplift/worker/upload_error.hpp"

namespace uplift::worker
{

    namespace
    {

        struct ContentTypeMapping
        {
            std::string_view extension;
            std::string_view content_type;
        };

        constexpr std::array<ContentTypeMapping, 16> kContentTypes{{
            {".png", "image/png"},
            {".jpg", "image/jpeg"},
            {".jpeg", "image/jpeg"},
            {".gif", "image/gif"},
            {".webp", "image/webp"},
            {".mp4", "video/mp4"},
            {".webm", "video/webm"},
            {".mov", "video/quicktime"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".ogg", "audio/ogg"},
            {".txt", "text/plain"},
            {".json", "application/json"},
            {".pdf", "application/pdf"},
            {".zip", "application/zip"},
            {".safetensors", "application/octet-stream"},
        }};

        void ensure_success(const HttpResponse &response, const std::string &action)
        {
            if (response.ok())
            {
                return;
            }
            std::string message = "HTTP " + std::to_string(response.status) + " during " + action;
            if (!response.body.empty())
            {
                message += ": " + response.body;
            }
            switch (response.status)
            {
            case 408:
            case 504:
                throw UploadError(ErrorKind::Timeout, message);
            case 413:
                throw UploadError(ErrorKind::FileTooLarge, message);
            default:
                throw UploadError(ErrorKind::Unknown, message);
            }
        }

    } // namespace

    std::string guess_content_type(const std::filesystem::path &path)
    {
        auto extension = path.extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        for (const auto &mapping : kContentTypes)
        {
            if (mapping.extension == extension)
            {
                return std::string(mapping.content_type);
            }
        }
        return "application/octet-stream";
    }

    HttpStorageBackend::HttpStorageBackend(HttpStorageOptions options)
        : options_(std::move(options))
    {
    }

    std::string HttpStorageBackend::upload(const std::filesystem::path &file, const CancelCheck &cancelled)
    {
        if (options_.api_key.empty())
        {
            throw UploadError(ErrorKind::Unknown, "No API key configured for the storage backend");
        }
        const auto content_type = guess_content_type(file);
        HttpClient client(options_.http, cancelled);

        HttpRequest initiate;
        initiate.method = "POST";
        initiate.url = options_.initiate_url;
        initiate.headers = {
            {"Authorization", "Key " + options_.api_key},
            {"Content-Type", "application/json"},
            {"Accept", "application/json"},
        };
        initiate.body = nlohmann::json{{"content_type", content_type}, {"file_name", file.filename().string()}}.dump();
        const auto initiated = client.send(initiate);
        ensure_success(initiated, "upload initiation");

        const auto reply = nlohmann::json::parse(initiated.body, nullptr, false);
        if (reply.is_discarded() || !reply.is_object() || !reply.contains("upload_url") ||
            !reply.contains("file_url") || !reply["upload_url"].is_string() || !reply["file_url"].is_string())
        {
            throw UploadError(ErrorKind::Unknown, "Storage backend returned an unexpected initiation reply");
        }
        const auto upload_url = reply["upload_url"].get<std::string>();
        const auto file_url = reply["file_url"].get<std::string>();

        HttpRequest put;
        put.method = "PUT";
        put.url = upload_url;
        put.headers = {{"Content-Type", content_type}};
        put.body_file = file;
        const auto stored = client.send(put);
        ensure_success(stored, "upload of " + file.filename().string());

        spdlog::info("Stored {} as {}", file.string(), file_url);
        return file_url;
    }

    void HttpStorageBackend::fetch(const std::string &url, const std::filesystem::path &destination,
                                   const FetchProgress &progress, const CancelCheck &cancelled)
    {
        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw UploadError(ErrorKind::Unknown, "Cannot create download target " + destination.string());
        }

        HttpClient client(options_.http, cancelled);
        HttpRequest request;
        request.url = url;
        std::uint64_t received = 0;
        const auto response = client.send(request, [&](std::string_view chunk, const HttpResponse &head)
                                          {
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
            if (!out)
            {
                throw UploadError(ErrorKind::Unknown, "Failed writing download to " + destination.string());
            }
            received += chunk.size();
            if (progress)
            {
                progress(received, head.content_length);
            } });
        ensure_success(response, "download of " + url);
        out.close();
        if (!out)
        {
            throw UploadError(ErrorKind::Unknown, "Failed writing download to " + destination.string());
        }
        spdlog::info("Fetched {} ({} bytes)", response.final_url, received);
    }

} // namespace uplift::worker
