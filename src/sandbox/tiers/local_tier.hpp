/*
 * local_tier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef JAILCHAIN_SANDBOX_TIERS_LOCAL_TIER_HPP
#define JAILCHAIN_SANDBOX_TIERS_LOCAL_TIER_HPP

#include "config/sandbox_config.hpp"
#include "sandbox/tier_executor.hpp"

#include <filesystem>
#include <functional>

namespace jailchain::sandbox {

/**
 * @brief Caller-supplied execution path used by the local tier
 */
using LocalRunner =
    std::function<TierResult(const ExecutionRequest&, std::stop_token)>;

/**
 * @brief Unisolated execution; always available, terminal fallback
 *
 * Uses the installed runner when there is one, otherwise runs the
 * interpreter directly in a scratch directory with the inherited
 * environment and only a wall-clock timeout.
 */
class LocalTier : public TierExecutor {
public:
    LocalTier(config::LocalTierConfig config,
              std::filesystem::path scratchRoot, LocalRunner runner = {});

    void setRunner(LocalRunner runner);

    [[nodiscard]] auto descriptor() const -> TierDescriptor override;
    [[nodiscard]] auto supports(Language language) const -> bool override;
    [[nodiscard]] auto probe() noexcept -> bool override;
    [[nodiscard]] auto probeDetail() const -> std::string override;
    [[nodiscard]] auto execute(const ExecutionRequest& request,
                               std::stop_token stopToken)
        -> TierResult override;

    /**
     * @brief Interpreter command for a request
     */
    [[nodiscard]] auto interpreterFor(const ExecutionRequest& request) const
        -> std::string;

private:
    auto runDirect(const ExecutionRequest& request, std::stop_token stopToken)
        -> TierResult;

    config::LocalTierConfig config_;
    std::filesystem::path scratchRoot_;
    LocalRunner runner_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIERS_LOCAL_TIER_HPP
