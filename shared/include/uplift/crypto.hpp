/**
 * Uplift - Randomness and content hashing built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>

namespace uplift::crypto
{

    // Lower-case hex string of byte_count random bytes.
    std::string random_hex(std::size_t byte_count);

    // BLAKE2b digests (crypto_generichash defaults), hex encoded.
    std::string hash_bytes(std::span<const std::byte> data);
    std::string hash_file(const std::filesystem::path &path);

} // namespace uplift::crypto
