/**
 * @file security_logger.cpp
 * @brief Audit events written to the "quantlab.security" logger
 *
 * @date 2025
 */

#include "quantlab/security/security_logger.hpp"
#include "quantlab/utils/logging_utils.hpp"

#include <spdlog/spdlog.h>

namespace quantlab {
namespace security {

SecurityLogger::SecurityLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : utils::GetSecurityLogger()) {
}

void SecurityLogger::SessionCreated(const std::string& session_id,
                                    const std::string& sandbox_id) {
    logger_->info("SECURITY: session_created session={} sandbox={}", session_id, sandbox_id);
}

void SecurityLogger::SessionDestroyed(const std::string& session_id,
                                      const std::string& reason) {
    logger_->info("SECURITY: session_destroyed session={} reason={}", session_id, reason);
}

void SecurityLogger::CodeExecution(const std::string& session_id,
                                   const std::string& code_hash,
                                   bool success) {
    if (success) {
        logger_->info("SECURITY: code_execution session={} hash={} success=true",
                      session_id, code_hash);
    } else {
        logger_->warn("SECURITY: code_execution session={} hash={} success=false",
                      session_id, code_hash);
    }
}

void SecurityLogger::SecurityViolation(const std::string& session_id,
                                       const std::string& violation_kind,
                                       const std::string& detail) {
    logger_->warn("SECURITY: security_violation session={} kind={} detail={}",
                  session_id, violation_kind, detail);
}

void SecurityLogger::ResourceLimitHit(const std::string& session_id,
                                      const std::string& resource,
                                      const std::string& limit) {
    logger_->warn("SECURITY: resource_limit_hit session={} resource={} limit={}",
                  session_id, resource, limit);
}

} // namespace security
} // namespace quantlab
