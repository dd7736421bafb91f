/**
 * @file hash_utils.hpp
 * @brief Content fingerprints for audit records
 *
 * Submitted research code is never written to the audit trail verbatim.
 * Instead each submission is identified by a truncated SHA-256 digest,
 * which is enough to correlate repeated submissions across sessions.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace quantlab {
namespace utils {

/**
 * @class HashUtils
 * @brief SHA-256 digests backed by OpenSSL
 *
 * **Usage Example**:
 * @code
 * std::string full = HashUtils::ComputeSHA256(code);          // 64 hex chars
 * std::string id = HashUtils::ComputeFingerprint(code, 16);   // first 16
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of a byte string
     * @return Lowercase hex digest (64 characters)
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Truncated SHA-256 fingerprint
     * @param data Content to fingerprint
     * @param length Number of hex characters to keep (clamped to 64)
     */
    static std::string ComputeFingerprint(const std::string& data, std::size_t length = 16);

    /// Check a string is a lowercase hex digest of the expected length
    static bool IsValidHexDigest(const std::string& digest, std::size_t expected_length);
};

} // namespace utils
} // namespace quantlab
