/*
 * test_container_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sandbox/tiers/container_tier.hpp"

#include <algorithm>
#include <filesystem>

using namespace jailchain;
using namespace jailchain::sandbox;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsSubsetOf;

class ContainerTierTest : public ::testing::Test {
protected:
    config::ContainerTierConfig config_;
    process::LaunchMarker marker_{"jailchain-launch-test"};
};

// =============================================================================
// Command construction
// =============================================================================

TEST_F(ContainerTierTest, DockerfileDropsToUnprivilegedUser) {
    auto dockerfile = ContainerTier::dockerfile(config_);
    EXPECT_THAT(dockerfile, HasSubstr("FROM python:3.11-slim"));
    EXPECT_THAT(dockerfile, HasSubstr("USER sandbox"));
    EXPECT_THAT(dockerfile, HasSubstr("WORKDIR /home/sandbox"));
}

TEST_F(ContainerTierTest, RunArgumentsIsolateTheContainer) {
    auto request = ExecutionRequest::make("print(1)", "python");
    auto args = ContainerTier::runArguments(
        config_, request, "/tmp/jailchain/ctr-abc/code.py", "jailchain-1-1-ff",
        marker_);

    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[0], "docker");
    EXPECT_EQ(args[1], "run");
    EXPECT_THAT(std::vector<std::string>({"--rm", "--read-only", "ALL",
                                          "no-new-privileges",
                                          "jailchain-1-1-ff"}),
                IsSubsetOf(args));
    EXPECT_THAT(args, Contains("/tmp:rw,noexec,nosuid,size=16m"));
    EXPECT_THAT(args, Contains("/tmp/jailchain/ctr-abc/code.py:"
                               "/home/sandbox/code.py:ro"));
    EXPECT_THAT(std::vector<std::string>(args.end() - 3, args.end()),
                ElementsAre("jailchain-launch-test", "python",
                            "/home/sandbox/code.py"));
    EXPECT_THAT(args, Contains("jailchain-sandbox"));
}

TEST_F(ContainerTierTest, NetworkIsDisabled) {
    auto args = ContainerTier::runArguments(
        config_, ExecutionRequest::make("true", "bash"), "/x/code.sh", "n",
        marker_);
    auto it = std::find(args.begin(), args.end(), "--network");
    ASSERT_NE(it, args.end());
    ASSERT_NE(it + 1, args.end());
    EXPECT_EQ(*(it + 1), "none");
    EXPECT_EQ(args.back(), "/home/sandbox/code.sh");
    EXPECT_EQ(*(args.end() - 2), "sh");
}

TEST_F(ContainerTierTest, LimitsArePassedAsDockerFlags) {
    config_.limits.maxMemoryBytes = 64ULL * 1024 * 1024;
    auto args = ContainerTier::runArguments(
        config_, ExecutionRequest::make("1", "python"), "/x/code.py", "n",
        marker_);
    EXPECT_THAT(args, Contains("64m"));
    EXPECT_THAT(args, Contains("--pids-limit"));
}

// =============================================================================
// Failure classification
// =============================================================================

TEST_F(ContainerTierTest, DaemonLossIsUnavailable) {
    process::ProcessOutput output;
    output.exitCode = 1;
    output.stderrText =
        "Cannot connect to the Docker daemon at unix:///var/run/docker.sock.";
    auto failure = ContainerTier::classifyDockerFailure(output, marker_);
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, ErrorKind::Unavailable);
}

TEST_F(ContainerTierTest, DockerRunErrorIsALaunchFailure) {
    process::ProcessOutput output;
    output.exitCode = 125;
    output.stderrText = "docker: Error response from daemon: conflict.";
    auto failure = ContainerTier::classifyDockerFailure(output, marker_);
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->kind, ErrorKind::RuntimeError);
}

TEST_F(ContainerTierTest, ProgramExitCodesAreNotDockerFailures) {
    process::ProcessOutput output;
    output.exitCode = 127;
    output.stderrText = "sh: 1: nosuchcmd: not found\n";
    EXPECT_FALSE(
        ContainerTier::classifyDockerFailure(output, marker_).has_value());

    output.exitCode = 1;
    output.stderrText = "Traceback (most recent call last):\nValueError\n";
    EXPECT_FALSE(
        ContainerTier::classifyDockerFailure(output, marker_).has_value());

    output.exitCode = 125;
    output.stderrText.clear();
    EXPECT_FALSE(
        ContainerTier::classifyDockerFailure(output, marker_).has_value());
}

TEST_F(ContainerTierTest, StartedProgramOutputIsNeverADockerFailure) {
    process::ProcessOutput output;
    output.exitCode = 125;
    output.stderrText =
        "jailchain-launch-test\ndocker: Error response from daemon: fake\n"
        "Cannot connect to the Docker daemon\n";
    EXPECT_FALSE(
        ContainerTier::classifyDockerFailure(output, marker_).has_value());
}

TEST_F(ContainerTierTest, MissingDockerBinaryFailsProbe) {
    config_.dockerBinary = "jailchain-no-such-docker";
    ContainerTier tier(config_, std::filesystem::temp_directory_path());
    EXPECT_FALSE(tier.probe());
    EXPECT_THAT(tier.probeDetail(), HasSubstr("not found"));
    EXPECT_FALSE(tier.supports(Language::Other));
}
