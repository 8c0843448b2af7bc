#include "uplift/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

namespace uplift::crypto
{

    namespace
    {

        using Digest = std::array<unsigned char, crypto_generichash_BYTES>;

        void init_sodium()
        {
            static std::once_flag flag;
            std::call_once(flag, []
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

        std::string hex(std::span<const unsigned char> bytes)
        {
            // sodium_bin2hex needs room for the terminating NUL.
            std::string text(bytes.size() * 2 + 1, '\0');
            sodium_bin2hex(text.data(), text.size(), bytes.data(), bytes.size());
            text.pop_back();
            return text;
        }

        void check(int rc, const char *what)
        {
            if (rc != 0)
            {
                throw std::runtime_error(std::string(what) + " failed");
            }
        }

    } // namespace

    std::string random_hex(std::size_t byte_count)
    {
        init_sodium();
        std::vector<unsigned char> bytes(byte_count);
        randombytes_buf(bytes.data(), bytes.size());
        return hex(bytes);
    }

    std::string hash_bytes(std::span<const std::byte> data)
    {
        init_sodium();
        Digest digest{};
        check(crypto_generichash(digest.data(), digest.size(), reinterpret_cast<const unsigned char *>(data.data()),
                                 data.size(), nullptr, 0),
              "crypto_generichash");
        return hex(digest);
    }

    std::string hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }

        init_sodium();
        crypto_generichash_state state;
        check(crypto_generichash_init(&state, nullptr, 0, crypto_generichash_BYTES), "crypto_generichash_init");

        std::vector<char> chunk(64 * 1024);
        while (file.read(chunk.data(), static_cast<std::streamsize>(chunk.size())) || file.gcount() > 0)
        {
            check(crypto_generichash_update(&state, reinterpret_cast<const unsigned char *>(chunk.data()),
                                            static_cast<unsigned long long>(file.gcount())),
                  "crypto_generichash_update");
        }
        if (file.bad())
        {
            throw std::runtime_error("Failed to read file for hashing: " + path.string());
        }

        Digest digest{};
        check(crypto_generichash_final(&state, digest.data(), digest.size()), "crypto_generichash_final");
        return hex(digest);
    }

} // namespace uplift::crypto
