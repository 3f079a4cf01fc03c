/**
 * @file hash_utils.cpp
 * @brief Implementation of SHA-256 and random id helpers
 *
 * @date 2025
 */

#include "warden/utils/hash_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>
#include <stdexcept>

namespace warden {
namespace utils {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string Sha256Hex(const void* data, std::size_t length) {
    DigestContext ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
    if (EVP_DigestUpdate(ctx.get(), data, length) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_length) != 1) {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    return HashUtils::BinaryToHex(digest, digest_length);
}

} // namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    return Sha256Hex(data.data(), data.size());
}

std::string HashUtils::ComputeSHA256(const std::vector<std::uint8_t>& data) {
    return Sha256Hex(data.data(), data.size());
}

std::string HashUtils::GenerateRandomHex(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return BinaryToHex(bytes.data(), bytes.size());
}

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    static const char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        hex.push_back(kDigits[data[i] >> 4]);
        hex.push_back(kDigits[data[i] & 0x0f]);
    }
    return hex;
}

} // namespace utils
} // namespace warden
