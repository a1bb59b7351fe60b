/*
 * test_sandbox_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock_tier.hpp"
#include "sandbox/process/subprocess.hpp"
#include "sandbox/sandbox_service.hpp"

#include <chrono>
#include <future>
#include <thread>

using namespace jailchain;
using namespace jailchain::sandbox;
using namespace jailchain::sandbox::test;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StartsWith;

class SandboxServiceTest : public ::testing::Test {
protected:
    auto addTier(TierKind kind) -> NiceMock<MockTier>* {
        auto tier = std::make_unique<NiceMock<MockTier>>(kind);
        auto* raw = tier.get();
        tiers_.push_back(std::move(tier));
        return raw;
    }

    auto buildService(SandboxPolicy policy = {}) -> SandboxService& {
        TierChain::Options options;
        options.order = {TierKind::Container, TierKind::Local};
        service_ = std::make_unique<SandboxService>(
            std::move(policy), std::move(tiers_), options, installer_);
        return *service_;
    }

    std::shared_ptr<NiceMock<MockInstaller>> installer_ =
        std::make_shared<NiceMock<MockInstaller>>();
    std::vector<std::unique_ptr<TierExecutor>> tiers_;
    std::unique_ptr<SandboxService> service_;
};

// =============================================================================
// Pipeline
// =============================================================================

TEST_F(SandboxServiceTest, FormatsTheTierThatRan) {
    auto* container = addTier(TierKind::Container);
    EXPECT_CALL(*container, execute(_, _)).WillOnce(Return(makeRaw("4\n")));

    auto outcome = buildService().executeCode("print(2+2)", "python");
    EXPECT_EQ(outcome.text, "🐳 Docker Sandbox:\n4\n");
    EXPECT_TRUE(outcome.succeeded());
}

TEST_F(SandboxServiceTest, MissingModuleInstallsAndRerunsChainOnce) {
    auto* container = addTier(TierKind::Container);
    ON_CALL(*container, probe()).WillByDefault(Return(false));
    auto* local = addTier(TierKind::Local);

    EXPECT_CALL(*local, execute(_, _))
        .Times(2)
        .WillOnce(Return(makeRaw(
            "", 1, "ModuleNotFoundError: No module named 'requests'\n")))
        .WillOnce(Return(makeRaw("200\n")));
    EXPECT_CALL(*installer_, install("requests"))
        .Times(1)
        .WillOnce(Return(std::expected<void, std::string>{}));

    SandboxPolicy policy;
    policy.allowAutoInstalls = true;
    auto outcome =
        buildService(policy).executeCode("import requests", "python");

    EXPECT_TRUE(outcome.retried);
    EXPECT_EQ(outcome.installedPackage, "requests");
    EXPECT_EQ(outcome.text, "💻 Local Execution:\n200\n");
}

TEST_F(SandboxServiceTest, PolicyChangeAppliesToNextRequest) {
    auto* container = addTier(TierKind::Container);
    auto* local = addTier(TierKind::Local);
    EXPECT_CALL(*container, execute(_, _)).WillOnce(Return(makeRaw("a")));
    EXPECT_CALL(*local, execute(_, _)).WillOnce(Return(makeRaw("b")));

    auto& service = buildService();
    EXPECT_EQ(service.executeCode("x", "python").tierUsed->kind,
              TierKind::Container);

    SandboxPolicy policy;
    policy.preferLocal = true;
    service.setPolicy(policy);
    EXPECT_TRUE(service.policy().preferLocal);
    EXPECT_EQ(service.executeCode("x", "python").tierUsed->kind,
              TierKind::Local);
}

TEST_F(SandboxServiceTest, CancelStopsInFlightExecution) {
    auto* container = addTier(TierKind::Container);
    EXPECT_CALL(*container, execute(_, _))
        .WillOnce([](const ExecutionRequest&, std::stop_token token) {
            auto deadline =
                std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!token.stop_requested() &&
                   std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            RawExecution raw;
            raw.kind = token.stop_requested() ? ErrorKind::Cancelled
                                              : ErrorKind::None;
            raw.detail = "Execution cancelled";
            return TierResult(raw);
        });

    auto& service = buildService();
    EXPECT_FALSE(service.cancel());

    auto future = service.executeAsync("while True: pass", "python");
    bool cancelled = false;
    for (int i = 0; i < 500 && !cancelled; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        cancelled = service.cancel();
    }
    ASSERT_TRUE(cancelled);

    auto outcome = future.get();
    EXPECT_EQ(outcome.errorKind, ErrorKind::Cancelled);
}

TEST_F(SandboxServiceTest, StatusDoesNotWaitForInFlightExecution) {
    auto* container = addTier(TierKind::Container);
    std::promise<void> started;
    std::promise<void> release;
    auto releaseFuture = release.get_future().share();
    EXPECT_CALL(*container, execute(_, _))
        .WillOnce([&started, releaseFuture](const ExecutionRequest&,
                                            std::stop_token) {
            started.set_value();
            releaseFuture.wait_for(std::chrono::seconds(10));
            return TierResult(makeRaw("done\n"));
        });

    auto& service = buildService();
    auto run = service.executeAsync("print('done')", "python");
    ASSERT_EQ(started.get_future().wait_for(std::chrono::seconds(5)),
              std::future_status::ready);

    auto status = std::async(std::launch::async,
                             [&service] { return service.getTierStatus(); });
    auto statusReady = status.wait_for(std::chrono::seconds(2));
    release.set_value();

    ASSERT_EQ(statusReady, std::future_status::ready);
    EXPECT_EQ(status.get().size(), 2u);
    EXPECT_EQ(run.get().text, "🐳 Docker Sandbox:\ndone\n");
}

TEST_F(SandboxServiceTest, ExternalStopTokenIsHonoured) {
    auto* container = addTier(TierKind::Container);
    EXPECT_CALL(*container, execute(_, _)).Times(0);

    std::stop_source source;
    source.request_stop();
    auto outcome =
        buildService().executeCode("print(1)", "python", source.get_token());
    EXPECT_EQ(outcome.errorKind, ErrorKind::Cancelled);
}

TEST_F(SandboxServiceTest, StatusJsonIsKeyedByTierName) {
    auto* container = addTier(TierKind::Container);
    ON_CALL(*container, probe()).WillByDefault(Return(false));
    addTier(TierKind::Local);

    auto status = buildService().getTierStatusJson();
    ASSERT_TRUE(status.contains("container"));
    ASSERT_TRUE(status.contains("local"));
    EXPECT_FALSE(status["container"]["available"].get<bool>());
    EXPECT_TRUE(status["container"]["cached"].get<bool>());
    EXPECT_TRUE(status["local"]["available"].get<bool>());
}

// =============================================================================
// Real tiers
// =============================================================================

class SandboxServiceIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.container.enabled = false;
        config_.processJail.enabled = false;
        config_.namespaceJail.enabled = false;
    }

    config::SandboxConfig config_;
};

TEST_F(SandboxServiceIntegrationTest, RestrictedInterpreterRunsWhenAloneAvailable) {
    auto service = SandboxService::create(config_);
    auto outcome = service->executeCode("print(2+2)", "python");

    ASSERT_TRUE(outcome.tierUsed.has_value());
    EXPECT_EQ(outcome.tierUsed->kind, TierKind::RestrictedInterpreter);
    EXPECT_THAT(outcome.text, StartsWith("🐍 Python Sandbox:"));
    EXPECT_THAT(outcome.text, HasSubstr("4"));
}

TEST_F(SandboxServiceIntegrationTest, ShellFallsBackToLocal) {
    if (!process::findExecutable("bash")) {
        GTEST_SKIP() << "bash not available";
    }
    auto service = SandboxService::create(config_);
    auto outcome = service->executeCode("echo hello", "bash");

    ASSERT_TRUE(outcome.tierUsed.has_value());
    EXPECT_EQ(outcome.tierUsed->kind, TierKind::Local);
    EXPECT_EQ(outcome.text, "💻 Local Execution:\nhello\n");
}
