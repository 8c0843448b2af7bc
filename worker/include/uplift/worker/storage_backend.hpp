/**
 * Uplift - Client side of the inference platform's file storage.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "uplift/worker/http_client.hpp"

namespace uplift::worker
{

    using FetchProgress = std::function<void(std::uint64_t received, std::optional<std::uint64_t> total)>;

    class StorageBackend
    {
    public:
        virtual ~StorageBackend() = default;

        // Uploads the file and returns the URL the platform serves it from.
        virtual std::string upload(const std::filesystem::path &file, const CancelCheck &cancelled) = 0;

        // Downloads url into destination, which the caller owns.
        virtual void fetch(const std::string &url, const std::filesystem::path &destination,
                           const FetchProgress &progress, const CancelCheck &cancelled) = 0;
    };

    struct HttpStorageOptions
    {
        // Endpoint that hands out a signed upload URL and the public file URL.
        std::string initiate_url{"https://rest.alpha.fal.ai/storage/upload/initiate?storage_type=fal-cdn-v3"};
        std::string api_key;
        HttpClient::Options http{};
    };

    class HttpStorageBackend : public StorageBackend
    {
    public:
        explicit HttpStorageBackend(HttpStorageOptions options);

        std::string upload(const std::filesystem::path &file, const CancelCheck &cancelled) override;

        void fetch(const std::string &url, const std::filesystem::path &destination,
                   const FetchProgress &progress, const CancelCheck &cancelled) override;

    private:
        HttpStorageOptions options_;
    };

    std::string guess_content_type(const std::filesystem::path &path);

} // namespace uplift::worker
