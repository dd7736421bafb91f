/**
 * @file code_guard.hpp
 * @brief Pre-execution checks on submitted research code
 *
 * Applied to every Execute() call before the sandbox is touched:
 * - **Size limit**: oversized payloads are rejected outright
 * - **Pattern scan**: watched substrings are audited, execution continues
 * - **Fingerprint**: truncated SHA-256 identifies the payload in audit records
 *
 * @date 2025
 */

#pragma once

#include "quantlab/security/security_logger.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace quantlab {
namespace security {

/**
 * @struct GuardConfig
 * @brief Limits and watched patterns
 */
struct GuardConfig {
    std::size_t max_code_bytes{50000};     ///< Payloads above this are rejected
    std::size_t fingerprint_length{16};    ///< Hex characters kept from SHA-256

    /// Substrings matched case-insensitively; matches are audited only
    std::vector<std::string> dangerous_patterns{
        "import os",
        "import subprocess",
        "import sys",
        "__import__",
        "exec(",
        "eval(",
        "compile(",
        "open(",
        "file("
    };
};

/**
 * @struct GuardVerdict
 * @brief Outcome of CodeGuard::Inspect()
 */
struct GuardVerdict {
    bool allowed{true};                          ///< false only for hard rejections
    std::string fingerprint;                     ///< Truncated SHA-256 of the code
    std::vector<std::string> matched_patterns;   ///< Watched patterns found
    std::string rejection_reason;                ///< Set when !allowed
};

/**
 * @class CodeGuard
 * @brief Applies GuardConfig to a payload and reports to an AuditSink
 *
 * **Usage Example**:
 * @code
 * CodeGuard guard(GuardConfig{}, audit);
 * auto verdict = guard.Inspect("default", code);
 * if (!verdict.allowed) {
 *     return ExecutionResult::Failure("default", ErrorKind::SECURITY_VIOLATION,
 *                                     verdict.rejection_reason);
 * }
 * @endcode
 */
class CodeGuard {
public:
    explicit CodeGuard(GuardConfig config = {}, std::shared_ptr<AuditSink> audit = nullptr);

    /**
     * @brief Check a payload
     *
     * Size is checked first; an oversized payload is neither scanned nor
     * fingerprinted beyond what the audit record needs.
     */
    GuardVerdict Inspect(const std::string& session_id, const std::string& code) const;

    const GuardConfig& GetConfig() const { return config_; }

private:
    GuardConfig config_;
    std::vector<std::string> lowered_patterns_;
    std::shared_ptr<AuditSink> audit_;
};

} // namespace security
} // namespace quantlab
