/*
 * test_restricted_interpreter_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "sandbox/tiers/restricted_interpreter_tier.hpp"

#include <pybind11/embed.h>

#include <chrono>
#include <thread>

namespace py = pybind11;
using namespace jailchain;
using namespace jailchain::sandbox;
using ::testing::HasSubstr;

class RestrictedInterpreterTierTest : public ::testing::Test {
protected:
    auto run(const std::string& code, std::stop_token token = {})
        -> TierResult {
        RestrictedInterpreterTier tier(config_);
        return tier.execute(ExecutionRequest::make(code, "python"), token);
    }

    config::RestrictedTierConfig config_;
};

TEST_F(RestrictedInterpreterTierTest, ProbeReflectsInterpreterState) {
    RestrictedInterpreterTier tier(config_);
    EXPECT_TRUE(tier.probe());
    EXPECT_TRUE(tier.supports(Language::Python));
    EXPECT_FALSE(tier.supports(Language::Shell));
}

TEST_F(RestrictedInterpreterTierTest, DetailWarnsAboutUninterruptibleCalls) {
    RestrictedInterpreterTier tier(config_);
    EXPECT_THAT(tier.probeDetail(), HasSubstr("no memory or CPU isolation"));
    EXPECT_THAT(tier.probeDetail(),
                HasSubstr("deadline cannot interrupt long builtin calls"));
}

TEST_F(RestrictedInterpreterTierTest, PrintsCapturedOutput) {
    auto result = run("print(2+2)");
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->stdoutText, "4\n");
    EXPECT_EQ(result->exitCode, 0);
    EXPECT_EQ(result->kind, ErrorKind::None);
}

TEST_F(RestrictedInterpreterTierTest, ImportIsNotAllowed) {
    auto result = run("import os\nprint(os.getcwd())");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->exitCode, 1);
    EXPECT_TRUE(result->stdoutText.empty());
    EXPECT_THAT(result->stderrText, HasSubstr("ImportError"));
}

TEST_F(RestrictedInterpreterTierTest, OpenIsNotAllowed) {
    auto result = run("open('/etc/passwd').read()");
    ASSERT_TRUE(result.has_value());
    EXPECT_THAT(result->stderrText, HasSubstr("NameError"));
}

TEST_F(RestrictedInterpreterTierTest, ProgramExceptionsAreOutput) {
    auto result = run("print('before')\n1/0");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->stdoutText, "before\n");
    EXPECT_THAT(result->stderrText, HasSubstr("ZeroDivisionError"));
    EXPECT_EQ(result->kind, ErrorKind::None);
}

TEST_F(RestrictedInterpreterTierTest, InfiniteLoopTimesOut) {
    config_.timeoutSeconds = 1;
    auto start = std::chrono::steady_clock::now();
    auto result = run("while True:\n    pass");
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, ErrorKind::Timeout);
    EXPECT_EQ(result->detail, "Execution timed out after 1 seconds");
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(RestrictedInterpreterTierTest, TimeoutCannotBeSwallowed) {
    config_.timeoutSeconds = 1;
    auto result = run(
        "while True:\n"
        "    try:\n"
        "        while True:\n"
        "            pass\n"
        "    except Exception:\n"
        "        pass");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, ErrorKind::Timeout);
}

TEST_F(RestrictedInterpreterTierTest, StopTokenCancels) {
    std::stop_source source;
    std::jthread canceller([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        source.request_stop();
    });

    auto result = run("while True:\n    pass", source.get_token());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->kind, ErrorKind::Cancelled);
}

TEST_F(RestrictedInterpreterTierTest, StreamsAreRestoredAfterRun) {
    (void)run("print('captured')");

    py::gil_scoped_acquire gil;
    auto sys = py::module_::import("sys");
    EXPECT_FALSE(py::isinstance(sys.attr("stdout"),
                                py::module_::import("io").attr("StringIO")));
}

TEST_F(RestrictedInterpreterTierTest, NonPythonIsRedirectedToLocal) {
    RestrictedInterpreterTier tier(config_);
    auto result = tier.execute(ExecutionRequest::make("echo hi", "bash"), {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Unavailable);
    EXPECT_EQ(result.error().detail,
              "Python sandbox only supports Python code. For bash, use local "
              "execution.");
}
