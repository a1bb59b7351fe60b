/*
 * sandbox_service.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_service.hpp"

#include "tiers/container_tier.hpp"
#include "tiers/local_tier.hpp"
#include "tiers/namespace_jail_tier.hpp"
#include "tiers/process_jail_tier.hpp"
#include "tiers/restricted_interpreter_tier.hpp"

#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

SandboxService::SandboxService(SandboxPolicy policy,
                               std::vector<std::unique_ptr<TierExecutor>> tiers,
                               TierChain::Options options,
                               std::shared_ptr<PackageInstaller> installer)
    : policy_(std::move(policy)),
      chain_(policy_, std::move(tiers), std::move(options)),
      formatter_(policy_),
      resolver_(policy_, std::move(installer)) {}

SandboxService::~SandboxService() { cancel(); }

auto SandboxService::buildTiers(const config::SandboxConfig& config)
    -> std::vector<std::unique_ptr<TierExecutor>> {
    const auto scratch = config.chain.scratchPath();
    std::vector<std::unique_ptr<TierExecutor>> tiers;

    if (config.container.enabled) {
        tiers.push_back(
            std::make_unique<ContainerTier>(config.container, scratch));
    }
    if (config.processJail.enabled) {
        tiers.push_back(std::make_unique<ProcessJailTier>(config.processJail));
    }
    if (config.namespaceJail.enabled) {
        tiers.push_back(
            std::make_unique<NamespaceJailTier>(config.namespaceJail, scratch));
    }
    if (config.restricted.enabled) {
        tiers.push_back(
            std::make_unique<RestrictedInterpreterTier>(config.restricted));
    }
    tiers.push_back(std::make_unique<LocalTier>(config.local, scratch));
    return tiers;
}

auto SandboxService::create(const config::SandboxConfig& config)
    -> std::unique_ptr<SandboxService> {
    TierChain::Options options;
    options.order = config.tierOrder();
    options.containerReprobe =
        std::chrono::seconds(config.chain.containerReprobeSeconds);
    options.backgroundProbe = config.chain.backgroundProbe;
    options.promotePrivilegedNamespaceJail =
        config.chain.promotePrivilegedNamespaceJail;
    options.privileged = NamespaceJailTier::runningPrivileged();

    auto installer = std::make_shared<PipInstaller>(
        config.dependencies.pythonExecutable,
        std::chrono::seconds(config.dependencies.installTimeoutSeconds));

    spdlog::info("Creating sandbox service ({})",
                 options.privileged ? "privileged" : "unprivileged");
    return std::make_unique<SandboxService>(config.policy, buildTiers(config),
                                            std::move(options),
                                            std::move(installer));
}

auto SandboxService::executeCode(const std::string& code,
                                 std::string_view language,
                                 std::stop_token stopToken)
    -> ExecutionOutcome {
    std::lock_guard executeLock(executeMutex_);

    std::stop_source source;
    {
        std::lock_guard lock(stopMutex_);
        activeStop_ = source;
    }
    std::stop_callback forward(stopToken, [source]() mutable {
        source.request_stop();
    });

    auto request = ExecutionRequest::make(code, language);
    spdlog::info("Executing {} bytes of {} code", request.code.size(),
                 request.languageName);

    auto outcome = resolver_.run([&] {
        return formatter_.format(chain_.execute(request, source.get_token()));
    });

    {
        std::lock_guard lock(stopMutex_);
        activeStop_.reset();
    }

    spdlog::info("Execution finished: {} via {}",
                 errorKindToString(outcome.errorKind),
                 outcome.tierUsed ? outcome.tierUsed->name : "no tier");
    return outcome;
}

auto SandboxService::executeAsync(std::string code, std::string language)
    -> std::future<ExecutionOutcome> {
    return std::async(std::launch::async,
                      [this, code = std::move(code),
                       language = std::move(language)] {
                          return executeCode(code, language);
                      });
}

auto SandboxService::cancel() -> bool {
    std::lock_guard lock(stopMutex_);
    if (!activeStop_) {
        return false;
    }
    spdlog::warn("Cancelling in-flight execution");
    activeStop_->request_stop();
    return true;
}

auto SandboxService::getTierStatus() -> std::vector<TierStatus> {
    std::lock_guard lock(policyMutex_);
    return chain_.getTierStatus();
}

auto SandboxService::getTierStatusJson() -> json {
    json j = json::object();
    for (const auto& status : getTierStatus()) {
        j[status.descriptor.name] = status.toJson();
    }
    return j;
}

void SandboxService::refreshAvailability() { chain_.refreshAvailability(); }

void SandboxService::setPolicy(SandboxPolicy policy) {
    std::scoped_lock lock(executeMutex_, policyMutex_);
    policy_ = std::move(policy);
    spdlog::debug("Policy updated: {}", policy_.toJson().dump());
}

auto SandboxService::policy() const -> SandboxPolicy {
    std::lock_guard lock(policyMutex_);
    return policy_;
}

}  // namespace jailchain::sandbox
