/*
 * test_result_formatter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock_tier.hpp"
#include "sandbox/result_formatter.hpp"

using namespace jailchain::sandbox;
using namespace jailchain::sandbox::test;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::StartsWith;

class ResultFormatterTest : public ::testing::Test {
protected:
    auto ran(TierKind kind, RawExecution raw) -> ChainOutcome {
        ChainOutcome chain;
        chain.tier = describeTier(kind);
        chain.raw = std::move(raw);
        return chain;
    }

    SandboxPolicy policy_;
    ResultFormatter formatter_{policy_};
};

// =============================================================================
// Tier output
// =============================================================================

TEST_F(ResultFormatterTest, LabelsOutputWithTierHeading) {
    auto outcome = formatter_.format(ran(TierKind::ProcessJail, makeRaw("4\n")));
    EXPECT_EQ(outcome.text, "🔥 Firejail Sandbox:\n4\n");
    EXPECT_TRUE(outcome.succeeded());
    ASSERT_TRUE(outcome.tierUsed.has_value());
    EXPECT_EQ(outcome.tierUsed->kind, TierKind::ProcessJail);
}

TEST_F(ResultFormatterTest, ProgramErrorsKeepStderrAndExitCode) {
    auto outcome = formatter_.format(
        ran(TierKind::Container, makeRaw("partial\n", 1, "ValueError: bad\n")));
    EXPECT_THAT(outcome.text, StartsWith("🐳 Docker Sandbox:\npartial\n"));
    EXPECT_THAT(outcome.text, HasSubstr("\nSTDERR:\nValueError: bad\n"));
    EXPECT_THAT(outcome.text, EndsWith("\nExit code: 1"));
    EXPECT_EQ(outcome.errorKind, ErrorKind::None);
    EXPECT_EQ(outcome.exitCode, 1);
}

TEST_F(ResultFormatterTest, EmptyOutputIsReported) {
    auto outcome = formatter_.format(
        ran(TierKind::RestrictedInterpreter, makeRaw("")));
    EXPECT_EQ(outcome.text,
              "🐍 Python Sandbox:\nCode executed successfully (no output)");
}

TEST_F(ResultFormatterTest, TimeoutNormalizes) {
    auto raw = makeRaw("tick\n");
    raw.kind = ErrorKind::Timeout;
    raw.detail = "Execution timed out after 30 seconds";

    auto outcome = formatter_.format(ran(TierKind::NamespaceJail, raw));
    EXPECT_EQ(outcome.errorKind, ErrorKind::Timeout);
    EXPECT_THAT(outcome.text,
                StartsWith("🐧 Namespace Sandbox:\nExecution timed out after "
                           "30 seconds"));
    EXPECT_THAT(outcome.text, HasSubstr("Partial output:\ntick\n"));
}

TEST_F(ResultFormatterTest, ResourceLimitNormalizes) {
    auto raw = makeRaw("", 137);
    raw.kind = ErrorKind::ResourceLimit;
    raw.detail = "Memory limit of 128 MB exceeded";

    auto outcome = formatter_.format(ran(TierKind::Local, raw));
    EXPECT_EQ(outcome.errorKind, ErrorKind::ResourceLimit);
    EXPECT_THAT(outcome.text, HasSubstr("Memory limit of 128 MB exceeded"));
}

TEST_F(ResultFormatterTest, RawSectionOnlyWhenRequested) {
    auto chain = ran(TierKind::Local, makeRaw("4\n", 0, "warning\n"));
    EXPECT_THAT(formatter_.format(chain).text,
                ::testing::Not(HasSubstr("--- Raw output ---")));

    policy_.showRawOutput = true;
    auto outcome = formatter_.format(chain);
    EXPECT_THAT(outcome.text, HasSubstr("--- Raw output ---\nexit code: 0"));
    EXPECT_EQ(outcome.errorKind, ErrorKind::None);
}

// =============================================================================
// Chain-level outcomes
// =============================================================================

TEST_F(ResultFormatterTest, ExhaustionListsTiers) {
    ChainOutcome chain;
    chain.attempts = {
        {TierKind::Container, ErrorKind::Unavailable, "no daemon"},
        {TierKind::ProcessJail, ErrorKind::Unavailable, "not installed"}};

    auto outcome = formatter_.format(chain);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Unavailable);
    EXPECT_FALSE(outcome.tierUsed.has_value());
    EXPECT_THAT(outcome.text, StartsWith("⚠️ Sandbox execution failed"));
    EXPECT_THAT(outcome.text,
                HasSubstr("🐳 Docker Sandbox (unavailable): no daemon"));
    EXPECT_THAT(outcome.text,
                HasSubstr("🔥 Firejail Sandbox (unavailable): not installed"));
    EXPECT_EQ(outcome.attempts.size(), 2u);
}

TEST_F(ResultFormatterTest, ExhaustionAfterLaunchErrorIsRuntimeError) {
    ChainOutcome chain;
    chain.attempts = {
        {TierKind::Container, ErrorKind::Unavailable, "no daemon"},
        {TierKind::Local, ErrorKind::RuntimeError, "spawn failed"}};
    EXPECT_EQ(formatter_.format(chain).errorKind, ErrorKind::RuntimeError);
}

TEST_F(ResultFormatterTest, CancelledBeforeAnyTier) {
    ChainOutcome chain;
    chain.cancelled = true;
    auto outcome = formatter_.format(chain);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Cancelled);
    EXPECT_THAT(outcome.text, StartsWith("⚠️"));
}
