/*
 * process_jail_tier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef JAILCHAIN_SANDBOX_TIERS_PROCESS_JAIL_TIER_HPP
#define JAILCHAIN_SANDBOX_TIERS_PROCESS_JAIL_TIER_HPP

#include "config/sandbox_config.hpp"
#include "sandbox/process/launch_marker.hpp"
#include "sandbox/process/subprocess.hpp"
#include "sandbox/resource_limiter.hpp"
#include "sandbox/tier_executor.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Runs code under a firejail security profile
 *
 * The jail gets a private home, /dev and /etc, a read-only root with the
 * system directories whitelisted, a private /tmp and no network. The code
 * is fed to the interpreter on stdin because the private filesystem hides
 * the host's temporary files.
 */
class ProcessJailTier : public TierExecutor {
public:
    explicit ProcessJailTier(config::ProcessJailTierConfig config);

    [[nodiscard]] auto descriptor() const -> TierDescriptor override;
    [[nodiscard]] auto supports(Language language) const -> bool override;
    [[nodiscard]] auto probe() noexcept -> bool override;
    [[nodiscard]] auto probeDetail() const -> std::string override;
    [[nodiscard]] auto execute(const ExecutionRequest& request,
                               std::stop_token stopToken)
        -> TierResult override;

    /**
     * @brief Complete firejail command line for a request
     *
     * The interpreter is started through the marker shim so a jail that
     * never came up can be told apart from code that failed.
     */
    [[nodiscard]] auto buildCommand(const std::string& firejail,
                                    const ExecutionRequest& request,
                                    const process::LaunchMarker& marker) const
        -> std::vector<std::string>;

    /**
     * @brief True when firejail itself refused to start the jail
     */
    [[nodiscard]] static auto isLaunchFailure(
        const process::ProcessOutput& output,
        const process::LaunchMarker& marker) -> bool;

private:
    void setDetail(std::string detail);

    config::ProcessJailTierConfig config_;
    ResourceLimiter limiter_;

    mutable std::mutex detailMutex_;
    std::string detail_{"not probed"};
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIERS_PROCESS_JAIL_TIER_HPP
