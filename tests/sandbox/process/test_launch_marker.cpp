/*
 * test_launch_marker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sandbox/process/launch_marker.hpp"

using namespace jailchain::sandbox::process;
using ::testing::ElementsAre;
using ::testing::StartsWith;

TEST(LaunchMarkerTest, TokensAreUnique) {
    auto first = LaunchMarker::generate();
    auto second = LaunchMarker::generate();
    EXPECT_THAT(first.token(), StartsWith("jailchain-launch-"));
    EXPECT_NE(first.token(), second.token());
}

TEST(LaunchMarkerTest, WrapPutsShimInFrontOfCommand) {
    LaunchMarker marker("tok");
    auto argv = marker.wrap({"python3", "-"});
    ASSERT_EQ(argv.size(), 6u);
    EXPECT_EQ(argv[0], "/bin/sh");
    EXPECT_EQ(argv[1], "-c");
    EXPECT_THAT(std::vector<std::string>(argv.begin() + 3, argv.end()),
                ElementsAre("tok", "python3", "-"));
}

TEST(LaunchMarkerTest, ShimAnnouncesAndPreservesProgramStreams) {
    auto marker = LaunchMarker::generate();
    SpawnOptions options;
    options.argv = marker.wrap(
        {"/bin/sh", "-c", "echo out; echo 'Error: bad input' >&2; exit 125"});
    options.timeout = std::chrono::seconds(10);

    auto result = runProcess(options);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(marker.reached(*result));
    EXPECT_EQ(result->exitCode, 125);

    marker.strip(*result);
    EXPECT_EQ(result->stdoutText, "out\n");
    EXPECT_EQ(result->stderrText, "Error: bad input\n");
}

TEST(LaunchMarkerTest, WrapperThatNeverExecsIsNotReached) {
    auto marker = LaunchMarker::generate();
    SpawnOptions options;
    options.argv = {"/bin/sh", "-c", "echo 'Error: no jail' >&2; exit 1"};
    options.timeout = std::chrono::seconds(10);

    auto result = runProcess(options);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(marker.reached(*result));
}
