/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests and random identifiers (OpenSSL)
 *
 * Used for content-addressed cache keys (WASM modules), container family
 * fingerprints in the pool, and unique container names.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers backed by OpenSSL
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a string
     * @return Lowercase hex digest (64 chars)
     */
    static std::string ComputeSHA256(const std::string& data);

    /// SHA-256 of a byte buffer
    static std::string ComputeSHA256(const std::vector<std::uint8_t>& data);

    /**
     * @brief Random hex identifier from the OpenSSL CSPRNG
     * @param num_bytes Entropy in bytes (hex output is twice as long)
     * @throws std::runtime_error if RAND_bytes fails
     */
    static std::string GenerateRandomHex(std::size_t num_bytes = 6);

    /// Lowercase hex encoding of a byte buffer
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace warden
