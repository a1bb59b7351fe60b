/*
 * test_resource_limiter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sandbox/resource_limiter.hpp"

#include <csignal>

using namespace jailchain::sandbox;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

class ResourceLimiterTest : public ::testing::Test {
protected:
    ResourceLimiter limiter_{ResourceLimits{}};
};

// =============================================================================
// Argument builders
// =============================================================================

TEST_F(ResourceLimiterTest, FirejailArgs) {
    EXPECT_THAT(limiter_.firejailArgs(),
                ElementsAre("--rlimit-as=134217728", "--rlimit-cpu=10",
                            "--rlimit-fsize=10485760", "--rlimit-nproc=10",
                            "--cpu=0"));
}

TEST_F(ResourceLimiterTest, DockerArgs) {
    auto args = limiter_.dockerArgs();
    EXPECT_THAT(args, Contains("128m"));
    EXPECT_THAT(args, Contains("0.50"));
    EXPECT_THAT(args, Contains("--pids-limit"));
    EXPECT_THAT(args, Contains("fsize=10485760:10485760"));
    EXPECT_THAT(args, Contains("cpu=10:11"));
}

TEST_F(ResourceLimiterTest, ChildLimitsSkipProcessCountWhenAsked) {
    auto withNproc = limiter_.childLimits(true);
    auto without = limiter_.childLimits(false);
    EXPECT_EQ(withNproc.size(), without.size() + 1);
    for (const auto& limit : without) {
        EXPECT_NE(limit.resource, RLIMIT_NPROC);
    }
}

TEST_F(ResourceLimiterTest, CpuSoftLimitPrecedesHardLimit) {
    for (const auto& limit : limiter_.childLimits()) {
        if (limit.resource == RLIMIT_CPU) {
            EXPECT_LE(limit.soft, 10u);
            EXPECT_LE(limit.soft, limit.hard);
        }
    }
}

// =============================================================================
// Classification
// =============================================================================

TEST_F(ResourceLimiterTest, ClassifiesSupervisorOutcomes) {
    process::ProcessOutput output;
    output.timedOut = true;
    EXPECT_EQ(limiter_.classify(output), ErrorKind::Timeout);

    output.cancelled = true;
    EXPECT_EQ(limiter_.classify(output), ErrorKind::Cancelled);
}

TEST_F(ResourceLimiterTest, ClassifiesLimitSignals) {
    process::ProcessOutput output;
    output.termSignal = SIGXCPU;
    output.exitCode = 128 + SIGXCPU;
    EXPECT_EQ(limiter_.classify(output), ErrorKind::ResourceLimit);
    EXPECT_THAT(limiter_.describeViolation(output), HasSubstr("CPU time"));

    output = {};
    output.exitCode = 137;
    EXPECT_EQ(limiter_.classify(output), ErrorKind::ResourceLimit);
}

TEST_F(ResourceLimiterTest, MemoryErrorIsALimitHit) {
    process::ProcessOutput output;
    output.exitCode = 1;
    output.stderrText = "Traceback...\nMemoryError\n";
    EXPECT_EQ(limiter_.classify(output), ErrorKind::ResourceLimit);
    EXPECT_THAT(limiter_.describeViolation(output), HasSubstr("128 MB"));
}

TEST_F(ResourceLimiterTest, ProgramErrorsAreNormalOutput) {
    process::ProcessOutput output;
    output.exitCode = 1;
    output.stderrText = "ZeroDivisionError: division by zero\n";
    EXPECT_EQ(limiter_.classify(output), ErrorKind::None);
}
