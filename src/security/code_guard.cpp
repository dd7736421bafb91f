/**
 * @file code_guard.cpp
 * @brief Size limit, watched-pattern audit and fingerprinting of code payloads
 *
 * **Policy**:
 * - Oversized payloads are rejected and audited as CODE_SIZE_LIMIT
 * - Watched patterns are matched case-insensitively and audited as
 *   DANGEROUS_CODE_PATTERN; the payload is still allowed
 *
 * @date 2025
 */

#include "quantlab/security/code_guard.hpp"
#include "quantlab/utils/hash_utils.hpp"
#include "quantlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace quantlab {
namespace security {

CodeGuard::CodeGuard(GuardConfig config, std::shared_ptr<AuditSink> audit)
    : config_(std::move(config)), audit_(std::move(audit)) {
    lowered_patterns_.reserve(config_.dangerous_patterns.size());
    for (const auto& pattern : config_.dangerous_patterns) {
        lowered_patterns_.push_back(utils::StringUtils::ToLower(pattern));
    }
}

GuardVerdict CodeGuard::Inspect(const std::string& session_id, const std::string& code) const {
    GuardVerdict verdict;
    verdict.fingerprint = utils::HashUtils::ComputeFingerprint(code, config_.fingerprint_length);

    // Size check
    if (code.size() > config_.max_code_bytes) {
        verdict.allowed = false;
        verdict.rejection_reason = "Code size (" + std::to_string(code.size()) +
                                   " bytes) exceeds " + std::to_string(config_.max_code_bytes) +
                                   " byte limit";
        spdlog::warn("Rejected oversized payload for session {} ({} bytes)", session_id, code.size());
        if (audit_) {
            audit_->SecurityViolation(session_id, kViolationCodeSize,
                                      "size=" + std::to_string(code.size()) +
                                      " limit=" + std::to_string(config_.max_code_bytes));
        }
        return verdict;
    }

    // Pattern scan (non-blocking)
    std::string lowered = utils::StringUtils::ToLower(code);
    for (std::size_t i = 0; i < lowered_patterns_.size(); ++i) {
        if (lowered.find(lowered_patterns_[i]) == std::string::npos) {
            continue;
        }
        verdict.matched_patterns.push_back(config_.dangerous_patterns[i]);
        if (audit_) {
            audit_->SecurityViolation(session_id, kViolationDangerousPattern,
                                      config_.dangerous_patterns[i]);
        }
    }

    if (!verdict.matched_patterns.empty()) {
        spdlog::debug("Session {} payload {} matched {} watched pattern(s)",
                      session_id, verdict.fingerprint, verdict.matched_patterns.size());
    }

    return verdict;
}

} // namespace security
} // namespace quantlab
