/*
 * tier_chain.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file tier_chain.hpp
 * @brief Ordered fallback across isolation tiers
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_TIER_CHAIN_HPP
#define JAILCHAIN_SANDBOX_TIER_CHAIN_HPP

#include "availability_cache.hpp"
#include "tier_executor.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief What the chain did for one request
 */
struct ChainOutcome {
    std::optional<TierDescriptor> tier;  ///< Tier that ran the code
    std::optional<RawExecution> raw;
    std::vector<TierAttempt> attempts;   ///< Tiers skipped or failed first
    bool cancelled{false};               ///< Stopped before any tier ran

    [[nodiscard]] auto exhausted() const noexcept -> bool {
        return !raw && !cancelled;
    }
};

/**
 * @brief Status of one tier as reported to the caller
 */
struct TierStatus {
    TierDescriptor descriptor;
    bool available{false};
    bool excluded{false};
    bool cached{false};
    std::optional<double> ageSeconds;
    std::string detail;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Selects, probes and dispatches tiers in preference order
 *
 * A tier is dispatched only after its probe succeeds. Isolation failures
 * (TierFailure) fall through to the next tier and the failed tier is not
 * tried again for that request. Anything the code itself produced,
 * including errors, timeouts and limit hits, ends the request. Container
 * availability is cached; other tiers are probed on every request.
 */
class TierChain {
public:
    struct Options {
        std::vector<TierKind> order{defaultTierOrder()};
        std::chrono::seconds containerReprobe{300};
        bool backgroundProbe{false};
        bool promotePrivilegedNamespaceJail{true};
        bool privileged{false};  ///< Host can build namespace jails
    };

    TierChain(const SandboxPolicy& policy,
              std::vector<std::unique_ptr<TierExecutor>> tiers,
              Options options);
    ~TierChain();

    TierChain(const TierChain&) = delete;
    TierChain& operator=(const TierChain&) = delete;

    [[nodiscard]] auto execute(const ExecutionRequest& request,
                               std::stop_token stopToken = {}) -> ChainOutcome;

    /**
     * @brief Availability of every configured tier, in dispatch order
     */
    [[nodiscard]] auto getTierStatus() -> std::vector<TierStatus>;

    /**
     * @brief Drop cached availability so the next request re-probes
     */
    void refreshAvailability();

    /**
     * @brief Dispatch order after applying the privilege decision
     */
    [[nodiscard]] auto effectiveOrder() const -> std::vector<TierKind>;

    [[nodiscard]] auto tier(TierKind kind) const -> TierExecutor*;

    [[nodiscard]] auto containerCache() noexcept -> AvailabilityCache& {
        return containerCache_;
    }

private:
    auto isAvailable(TierKind kind, TierExecutor& executor) -> bool;
    auto executeLocalOnly(const ExecutionRequest& request,
                          std::stop_token stopToken) -> ChainOutcome;

    const SandboxPolicy& policy_;
    std::vector<std::unique_ptr<TierExecutor>> tiers_;
    Options options_;
    AvailabilityCache containerCache_;
    std::unique_ptr<AvailabilityMonitor> monitor_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIER_CHAIN_HPP
