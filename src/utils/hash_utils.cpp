/**
 * @file hash_utils.cpp
 * @brief SHA-256 fingerprints via OpenSSL
 *
 * Code payloads never appear in audit records; a short prefix of their
 * SHA-256 digest stands in for them.
 *
 * @date 2025
 */

#include "quantlab/utils/hash_utils.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace quantlab {
namespace utils {

namespace {

/**
 * @brief Convert binary data to hexadecimal string
 * @param data Binary data buffer
 * @param length Number of bytes to convert
 * @return Lowercase hexadecimal string representation
 */
std::string BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

} // anonymous namespace

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::ComputeFingerprint(const std::string& data, std::size_t length) {
    std::string digest = ComputeSHA256(data);
    return digest.substr(0, std::min(length, digest.size()));
}

bool HashUtils::IsValidHexDigest(const std::string& digest, std::size_t expected_length) {
    if (digest.size() != expected_length) {
        return false;
    }
    return std::all_of(digest.begin(), digest.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

} // namespace utils
} // namespace quantlab
