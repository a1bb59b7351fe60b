/*
 * test_types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "sandbox/types.hpp"

using namespace jailchain::sandbox;

// =============================================================================
// Language
// =============================================================================

TEST(LanguageTest, ParsesKnownTags) {
    EXPECT_EQ(parseLanguage("python"), Language::Python);
    EXPECT_EQ(parseLanguage("Python3"), Language::Python);
    EXPECT_EQ(parseLanguage("py"), Language::Python);
    EXPECT_EQ(parseLanguage("bash"), Language::Shell);
    EXPECT_EQ(parseLanguage("sh"), Language::Shell);
    EXPECT_EQ(parseLanguage("ruby"), Language::Other);
}

TEST(LanguageTest, RequestKeepsRawTagForOtherLanguages) {
    auto request = ExecutionRequest::make("puts 1", "Ruby");
    EXPECT_EQ(request.language, Language::Other);
    EXPECT_EQ(request.languageName, "ruby");
    EXPECT_EQ(request.fileExtension(), ".rb");
}

TEST(LanguageTest, EmptyTagDefaultsToPython) {
    auto request = ExecutionRequest::make("print(1)", "");
    EXPECT_EQ(request.language, Language::Python);
    EXPECT_EQ(request.fileExtension(), ".py");
}

// =============================================================================
// Tiers
// =============================================================================

TEST(TierKindTest, AcceptsAliases) {
    EXPECT_EQ(tierKindFromString("docker"), TierKind::Container);
    EXPECT_EQ(tierKindFromString("firejail"), TierKind::ProcessJail);
    EXPECT_EQ(tierKindFromString("namespace"), TierKind::NamespaceJail);
    EXPECT_EQ(tierKindFromString("restricted"),
              TierKind::RestrictedInterpreter);
    EXPECT_EQ(tierKindFromString("LOCAL"), TierKind::Local);
    EXPECT_FALSE(tierKindFromString("vm").has_value());
}

TEST(TierKindTest, NamesRoundTrip) {
    for (auto kind : defaultTierOrder()) {
        EXPECT_EQ(tierKindFromString(tierKindToString(kind)), kind);
    }
}

TEST(TierKindTest, DefaultOrderIsMostIsolatedFirst) {
    auto order = defaultTierOrder();
    ASSERT_EQ(order.size(), 5u);
    EXPECT_EQ(order.front(), TierKind::Container);
    EXPECT_EQ(order.back(), TierKind::Local);
}

TEST(TierKindTest, DescriptorHeadings) {
    EXPECT_EQ(describeTier(TierKind::Container).heading(), "🐳 Docker Sandbox");
    EXPECT_EQ(describeTier(TierKind::ProcessJail).heading(),
              "🔥 Firejail Sandbox");
    EXPECT_EQ(describeTier(TierKind::RestrictedInterpreter).heading(),
              "🐍 Python Sandbox");
    EXPECT_EQ(describeTier(TierKind::Local).heading(), "💻 Local Execution");
}

// =============================================================================
// Limits and policy
// =============================================================================

TEST(ResourceLimitsTest, DefaultsMatchCrossTierPolicy) {
    ResourceLimits limits;
    EXPECT_EQ(limits.maxWall, std::chrono::seconds(30));
    EXPECT_EQ(limits.maxMemoryBytes, 128u * 1024 * 1024);
}

TEST(ResourceLimitsTest, FromJsonOverridesOnlyGivenKeys) {
    auto limits = ResourceLimits::fromJson(
        json{{"maxWallSeconds", 5}, {"maxMemoryMB", 64}}, ResourceLimits{});
    EXPECT_EQ(limits.maxWall, std::chrono::seconds(5));
    EXPECT_EQ(limits.maxMemoryBytes, 64u * 1024 * 1024);
    EXPECT_EQ(limits.maxCpu, std::chrono::seconds(10));
    EXPECT_DOUBLE_EQ(limits.cpuQuota, 0.5);
}

TEST(ResourceLimitsTest, FromJsonStartsFromGivenDefaults) {
    auto plain = ResourceLimits::fromJson(json{{"maxProcesses", 4}});
    EXPECT_EQ(plain.maxProcesses, 4u);
    EXPECT_EQ(plain.maxWall, std::chrono::seconds(30));

    ResourceLimits tight;
    tight.maxWall = std::chrono::seconds(2);
    auto layered = ResourceLimits::fromJson(json{{"maxCpuSeconds", 1}}, tight);
    EXPECT_EQ(layered.maxWall, std::chrono::seconds(2));
    EXPECT_EQ(layered.maxCpu, std::chrono::seconds(1));
}

TEST(SandboxPolicyTest, ParsesExcludedTiers) {
    auto policy = SandboxPolicy::fromJson(
        json{{"preferLocal", true},
             {"excludedTiers", json::array({"docker", "bogus"})}});
    EXPECT_TRUE(policy.preferLocal);
    EXPECT_TRUE(policy.allowAutoExec);
    EXPECT_TRUE(policy.excludes(TierKind::Container));
    EXPECT_FALSE(policy.excludes(TierKind::ProcessJail));
    EXPECT_EQ(policy.excludedTiers.size(), 1u);
}

TEST(ExecutionOutcomeTest, JsonCarriesTierAndAttempts) {
    ExecutionOutcome outcome;
    outcome.text = "4";
    outcome.tierUsed = describeTier(TierKind::Local);
    outcome.attempts.push_back(
        {TierKind::Container, ErrorKind::Unavailable, "no daemon"});

    auto j = outcome.toJson();
    EXPECT_TRUE(j["succeeded"].get<bool>());
    EXPECT_EQ(j["tierUsed"]["name"], "local");
    ASSERT_EQ(j["attempts"].size(), 1u);
    EXPECT_EQ(j["attempts"][0]["errorKind"], "unavailable");
    EXPECT_TRUE(j["installedPackage"].is_null());
}
