/*
 * resource_limiter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file resource_limiter.hpp
 * @brief Resource ceilings for sandboxed executions
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_RESOURCE_LIMITER_HPP
#define JAILCHAIN_SANDBOX_RESOURCE_LIMITER_HPP

#include "process/subprocess.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Turns a ResourceLimits value into enforcement mechanisms
 *
 * The same ceilings are rendered three ways: rlimits applied to a forked
 * child before exec, firejail command-line flags, and docker run flags.
 * Limits are fixed at construction and never changed by runtime policy.
 */
class ResourceLimiter {
public:
    ResourceLimiter() = default;
    explicit ResourceLimiter(ResourceLimits limits);

    [[nodiscard]] auto limits() const noexcept -> const ResourceLimits& {
        return limits_;
    }

    /**
     * @brief rlimits for a child process
     * @param includeProcessLimit RLIMIT_NPROC counts every process of the
     *        real uid, so it is only meaningful for a dedicated uid
     *
     * Values are clamped to the current hard limits so an unprivileged
     * caller never asks for more than it holds.
     */
    [[nodiscard]] auto childLimits(bool includeProcessLimit = true) const
        -> std::vector<process::ChildLimit>;

    [[nodiscard]] auto firejailArgs() const -> std::vector<std::string>;

    [[nodiscard]] auto dockerArgs() const -> std::vector<std::string>;

    /**
     * @brief Classify how a supervised child ended
     * @return None, Timeout, Cancelled or ResourceLimit
     */
    [[nodiscard]] auto classify(const process::ProcessOutput& output) const
        -> ErrorKind;

    /**
     * @brief Human readable reason for a ResourceLimit classification
     */
    [[nodiscard]] auto describeViolation(
        const process::ProcessOutput& output) const -> std::string;

private:
    ResourceLimits limits_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_RESOURCE_LIMITER_HPP
