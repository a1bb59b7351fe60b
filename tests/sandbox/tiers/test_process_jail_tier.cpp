/*
 * test_process_jail_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sandbox/tiers/process_jail_tier.hpp"

using namespace jailchain;
using namespace jailchain::sandbox;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ProcessJailTierTest : public ::testing::Test {
protected:
    config::ProcessJailTierConfig config_;
    process::LaunchMarker marker_{"jailchain-launch-test"};
};

TEST_F(ProcessJailTierTest, CommandFeedsPythonOnStdin) {
    ProcessJailTier tier(config_);
    auto cmd = tier.buildCommand("/usr/bin/firejail",
                                 ExecutionRequest::make("print(1)", "python"),
                                 marker_);
    ASSERT_FALSE(cmd.empty());
    EXPECT_EQ(cmd.front(), "/usr/bin/firejail");
    EXPECT_THAT(cmd, Contains("--net=none"));
    EXPECT_THAT(cmd, Contains("--private"));
    EXPECT_THAT(cmd, Contains("--read-only=/"));
    EXPECT_THAT(cmd, Contains("--rlimit-as=134217728"));
    EXPECT_THAT(cmd, Contains("jailchain-launch-test"));
    EXPECT_THAT(std::vector<std::string>(cmd.end() - 2, cmd.end()),
                ElementsAre("python3", "-"));
}

TEST_F(ProcessJailTierTest, ShellAndOtherLanguages) {
    ProcessJailTier tier(config_);
    auto shell = tier.buildCommand(
        "firejail", ExecutionRequest::make("echo 1", "sh"), marker_);
    EXPECT_THAT(std::vector<std::string>(shell.end() - 2, shell.end()),
                ElementsAre("bash", "-s"));

    auto ruby = tier.buildCommand(
        "firejail", ExecutionRequest::make("puts 1", "ruby"), marker_);
    EXPECT_THAT(std::vector<std::string>(ruby.end() - 2, ruby.end()),
                ElementsAre("ruby", "-"));
    EXPECT_TRUE(tier.supports(Language::Other));
}

TEST_F(ProcessJailTierTest, DetectsFirejailRefusal) {
    process::ProcessOutput output;
    output.exitCode = 1;
    output.stderrText = "Error: cannot establish communication with the parent";
    EXPECT_TRUE(ProcessJailTier::isLaunchFailure(output, marker_));
}

TEST_F(ProcessJailTierTest, ProgramErrorsAreNotRefusals) {
    process::ProcessOutput output;
    output.exitCode = 1;
    output.stderrText =
        "jailchain-launch-test\nTraceback (most recent call last):\n"
        "NameError\n";
    EXPECT_FALSE(ProcessJailTier::isLaunchFailure(output, marker_));

    output.stdoutText = "partial";
    output.stderrText = "jailchain-launch-test\nError: something printed";
    EXPECT_FALSE(ProcessJailTier::isLaunchFailure(output, marker_));
}

TEST_F(ProcessJailTierTest, ProgramStderrLookingLikeFirejailIsNotRefusal) {
    process::ProcessOutput output;
    output.exitCode = 1;
    output.stderrText = "jailchain-launch-test\nError: bad input\n";
    EXPECT_FALSE(ProcessJailTier::isLaunchFailure(output, marker_));

    marker_.strip(output);
    EXPECT_EQ(output.stderrText, "Error: bad input\n");
}

TEST_F(ProcessJailTierTest, TimeoutBeforeLaunchIsNotRefusal) {
    process::ProcessOutput output;
    output.timedOut = true;
    EXPECT_FALSE(ProcessJailTier::isLaunchFailure(output, marker_));
}

TEST_F(ProcessJailTierTest, MissingFirejailIsUnavailable) {
    config_.firejailBinary = "jailchain-no-such-firejail";
    ProcessJailTier tier(config_);
    EXPECT_FALSE(tier.probe());
    EXPECT_THAT(tier.probeDetail(), HasSubstr("not found"));

    auto result = tier.execute(ExecutionRequest::make("print(1)", "python"), {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Unavailable);
}
