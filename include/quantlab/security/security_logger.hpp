/**
 * @file security_logger.hpp
 * @brief Audit trail for research sessions
 *
 * Every session lifecycle event and every code submission is recorded
 * through an AuditSink. The production sink writes "SECURITY:" lines to
 * the dedicated spdlog logger "quantlab.security"; tests substitute a
 * recording sink.
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace quantlab {
namespace security {

/// Violation kind: payload larger than the configured limit
constexpr const char* kViolationCodeSize = "CODE_SIZE_LIMIT";

/// Violation kind: payload contains a watched pattern
constexpr const char* kViolationDangerousPattern = "DANGEROUS_CODE_PATTERN";

/// Resource kind: execution exceeded its time budget
constexpr const char* kResourceExecutionTimeout = "EXECUTION_TIMEOUT";

/**
 * @class AuditSink
 * @brief Append-only sink for security-relevant events
 *
 * Implementations must be safe to call from several threads and must not
 * throw.
 */
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void SessionCreated(const std::string& session_id,
                                const std::string& sandbox_id) = 0;

    virtual void SessionDestroyed(const std::string& session_id,
                                  const std::string& reason) = 0;

    /**
     * @brief Record one execution attempt
     * @param code_hash Fingerprint of the submitted code (never the code itself)
     * @param success Whether the execution produced a successful result
     */
    virtual void CodeExecution(const std::string& session_id,
                               const std::string& code_hash,
                               bool success) = 0;

    virtual void SecurityViolation(const std::string& session_id,
                                   const std::string& violation_kind,
                                   const std::string& detail) = 0;

    virtual void ResourceLimitHit(const std::string& session_id,
                                  const std::string& resource,
                                  const std::string& limit) = 0;
};

/**
 * @class SecurityLogger
 * @brief AuditSink writing to spdlog
 *
 * **Output format**:
 * ```
 * [12:00:01] [info] SECURITY: session_created session=default sandbox=3f2a9c
 * [12:00:05] [info] SECURITY: code_execution session=default hash=9f86d081884c7d65 success=true
 * [12:00:06] [warning] SECURITY: security_violation session=default kind=DANGEROUS_CODE_PATTERN detail=import os
 * ```
 */
class SecurityLogger : public AuditSink {
public:
    /**
     * @brief Construct sink
     * @param logger Target logger (defaults to the "quantlab.security" logger)
     */
    explicit SecurityLogger(std::shared_ptr<spdlog::logger> logger = nullptr);

    void SessionCreated(const std::string& session_id,
                        const std::string& sandbox_id) override;
    void SessionDestroyed(const std::string& session_id,
                          const std::string& reason) override;
    void CodeExecution(const std::string& session_id,
                       const std::string& code_hash,
                       bool success) override;
    void SecurityViolation(const std::string& session_id,
                           const std::string& violation_kind,
                           const std::string& detail) override;
    void ResourceLimitHit(const std::string& session_id,
                          const std::string& resource,
                          const std::string& limit) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace security
} // namespace quantlab
