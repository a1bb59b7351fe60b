/*
 * container_tier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file container_tier.hpp
 * @brief Docker container isolation tier
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_TIERS_CONTAINER_TIER_HPP
#define JAILCHAIN_SANDBOX_TIERS_CONTAINER_TIER_HPP

#include "config/sandbox_config.hpp"
#include "sandbox/process/launch_marker.hpp"
#include "sandbox/process/subprocess.hpp"
#include "sandbox/tier_executor.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Runs code in a throwaway Docker container
 *
 * The sandbox image is built lazily on first use and cached per tag. Each
 * request gets a uniquely named container with networking disabled, a
 * read-only root, a private /tmp, dropped capabilities and the configured
 * memory, CPU and pid limits. The code file is bind-mounted read-only.
 * On timeout or cancellation the container is force-removed.
 */
class ContainerTier : public TierExecutor {
public:
    ContainerTier(config::ContainerTierConfig config,
                  std::filesystem::path scratchRoot);
    ~ContainerTier() override;

    ContainerTier(const ContainerTier&) = delete;
    ContainerTier& operator=(const ContainerTier&) = delete;

    [[nodiscard]] auto descriptor() const -> TierDescriptor override;
    [[nodiscard]] auto supports(Language language) const -> bool override;
    [[nodiscard]] auto probe() noexcept -> bool override;
    [[nodiscard]] auto probeDetail() const -> std::string override;
    [[nodiscard]] auto execute(const ExecutionRequest& request,
                               std::stop_token stopToken)
        -> TierResult override;

    /**
     * @brief Forget that the image exists; next execute re-checks it
     */
    void invalidateImage();

    /**
     * @brief Dockerfile used to build the sandbox image
     */
    [[nodiscard]] static auto dockerfile(
        const config::ContainerTierConfig& config) -> std::string;

    /**
     * @brief Full docker command line for one run
     *
     * The program is started through the marker shim inside the container.
     */
    [[nodiscard]] static auto runArguments(
        const config::ContainerTierConfig& config,
        const ExecutionRequest& request,
        const std::filesystem::path& hostCodeFile,
        const std::string& containerName,
        const process::LaunchMarker& marker) -> std::vector<std::string>;

    /**
     * @brief Distinguish docker's own failures from program output
     *
     * Once the marker shows the program started, nothing in the output is
     * attributed to docker. Before that, only docker's own error messages
     * count: the container's exit status is passed through unchanged.
     * @return A TierFailure when docker, not the program, failed
     */
    [[nodiscard]] static auto classifyDockerFailure(
        const process::ProcessOutput& output,
        const process::LaunchMarker& marker) -> std::optional<TierFailure>;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIERS_CONTAINER_TIER_HPP
