#include "quantlab/security/code_guard.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace quantlab;

TEST(CodeGuardTest, CleanCodeIsAllowed) {
    auto audit = std::make_shared<fakes::RecordingAuditSink>();
    security::CodeGuard guard({}, audit);

    auto verdict = guard.Inspect("s1", "print(qb.Securities)");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_TRUE(verdict.matched_patterns.empty());
    EXPECT_EQ(16u, verdict.fingerprint.size());
    EXPECT_EQ(0u, audit->Count("violation"));
}

TEST(CodeGuardTest, OversizedCodeIsRejected) {
    auto audit = std::make_shared<fakes::RecordingAuditSink>();
    security::CodeGuard guard({}, audit);

    std::string code(50001, 'x');
    auto verdict = guard.Inspect("s1", code);
    EXPECT_FALSE(verdict.allowed);
    EXPECT_EQ("Code size (50001 bytes) exceeds 50000 byte limit", verdict.rejection_reason);

    auto events = audit->Events();
    ASSERT_EQ(1u, events.size());
    EXPECT_EQ(security::kViolationCodeSize, events[0].detail);
}

TEST(CodeGuardTest, ExactLimitIsAllowed) {
    security::CodeGuard guard;
    EXPECT_TRUE(guard.Inspect("s1", std::string(50000, 'x')).allowed);
}

TEST(CodeGuardTest, DangerousPatternsAreAuditedNotBlocked) {
    auto audit = std::make_shared<fakes::RecordingAuditSink>();
    security::CodeGuard guard({}, audit);

    auto verdict = guard.Inspect("s1", "IMPORT OS\nx = eval('1+1')");
    EXPECT_TRUE(verdict.allowed);
    ASSERT_EQ(2u, verdict.matched_patterns.size());
    EXPECT_EQ("import os", verdict.matched_patterns[0]);
    EXPECT_EQ("eval(", verdict.matched_patterns[1]);
    EXPECT_EQ(2u, audit->Count("violation"));
}

TEST(CodeGuardTest, CustomLimits) {
    security::GuardConfig config;
    config.max_code_bytes = 10;
    config.dangerous_patterns = {"rm -rf"};
    config.fingerprint_length = 8;
    security::CodeGuard guard(config);

    EXPECT_FALSE(guard.Inspect("s1", "12345678901").allowed);
    auto verdict = guard.Inspect("s1", "!rm -rf /");
    EXPECT_TRUE(verdict.allowed);
    EXPECT_EQ(1u, verdict.matched_patterns.size());
    EXPECT_EQ(8u, verdict.fingerprint.size());
}

TEST(CodeGuardTest, FingerprintIsStable) {
    security::CodeGuard guard;
    EXPECT_EQ(guard.Inspect("a", "x = 1").fingerprint, guard.Inspect("b", "x = 1").fingerprint);
    EXPECT_NE(guard.Inspect("a", "x = 1").fingerprint, guard.Inspect("a", "x = 2").fingerprint);
}
