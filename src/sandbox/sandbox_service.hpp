/*
 * sandbox_service.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file sandbox_service.hpp
 * @brief Entry point for executing untrusted code through the tier chain
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_SANDBOX_SERVICE_HPP
#define JAILCHAIN_SANDBOX_SANDBOX_SERVICE_HPP

#include "config/sandbox_config.hpp"
#include "dependency_resolver.hpp"
#include "result_formatter.hpp"
#include "tier_chain.hpp"
#include "types.hpp"

#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Runs code through the chain, the resolver and the formatter
 *
 * Requests are serialized: at most one execution is in flight. Policy
 * changes take effect for the next request.
 */
class SandboxService {
public:
    SandboxService(SandboxPolicy policy,
                   std::vector<std::unique_ptr<TierExecutor>> tiers,
                   TierChain::Options options,
                   std::shared_ptr<PackageInstaller> installer);
    ~SandboxService();

    // Non-copyable, non-movable
    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;
    SandboxService(SandboxService&&) = delete;
    SandboxService& operator=(SandboxService&&) = delete;

    /**
     * @brief Build every enabled tier from configuration
     */
    [[nodiscard]] static auto create(const config::SandboxConfig& config)
        -> std::unique_ptr<SandboxService>;

    [[nodiscard]] static auto buildTiers(const config::SandboxConfig& config)
        -> std::vector<std::unique_ptr<TierExecutor>>;

    /**
     * @brief Execute code and block until an outcome is available
     * @param code Source text
     * @param language Language tag ("python", "bash", ...)
     * @param stopToken Optional caller cancellation
     */
    [[nodiscard]] auto executeCode(const std::string& code,
                                   std::string_view language,
                                   std::stop_token stopToken = {})
        -> ExecutionOutcome;

    /**
     * @brief Execute on a background task
     *
     * The task refers to this service: the service must outlive the
     * returned future, or the future must be waited on before the service
     * is destroyed.
     */
    [[nodiscard]] auto executeAsync(std::string code, std::string language)
        -> std::future<ExecutionOutcome>;

    /**
     * @brief Stop the in-flight request, if any
     * @return true if a request was running
     */
    auto cancel() -> bool;

    /**
     * @brief Availability of every configured tier
     *
     * Does not wait for an in-flight execution.
     */
    [[nodiscard]] auto getTierStatus() -> std::vector<TierStatus>;
    [[nodiscard]] auto getTierStatusJson() -> json;

    void refreshAvailability();

    void setPolicy(SandboxPolicy policy);
    [[nodiscard]] auto policy() const -> SandboxPolicy;

    [[nodiscard]] auto chain() noexcept -> TierChain& { return chain_; }
    [[nodiscard]] auto resolver() noexcept -> DependencyResolver& {
        return resolver_;
    }

private:
    // Declared before the components that hold references to it.
    SandboxPolicy policy_;
    TierChain chain_;
    ResultFormatter formatter_;
    DependencyResolver resolver_;

    std::mutex executeMutex_;
    // Guards policy_ against readers that do not hold executeMutex_
    mutable std::mutex policyMutex_;
    std::mutex stopMutex_;
    std::optional<std::stop_source> activeStop_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_SANDBOX_SERVICE_HPP
