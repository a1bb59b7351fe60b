/*
 * namespace_jail_tier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file namespace_jail_tier.hpp
 * @brief Linux namespace + chroot isolation tier
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_TIERS_NAMESPACE_JAIL_TIER_HPP
#define JAILCHAIN_SANDBOX_TIERS_NAMESPACE_JAIL_TIER_HPP

#include "config/sandbox_config.hpp"
#include "sandbox/tier_executor.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Location of the interpreter and its standard library
 */
struct InterpreterInfo {
    std::filesystem::path executable;
    std::filesystem::path stdlib;
};

/**
 * @brief Runs code in fresh namespaces under chroot, or in a restricted
 *        working directory when not privileged
 *
 * Privileged mode builds a minimal root per request (interpreter, shells,
 * their shared-library closure and the standard library), enters new pid,
 * mount, network, ipc and uts namespaces and drops to an unprivileged uid
 * inside the chroot. Unprivileged mode runs the code in rootless user,
 * network, ipc and uts namespaces with a scratch working directory, a
 * scrubbed environment and rlimits. Where the kernel refuses user
 * namespaces it keeps only the directory, environment and rlimits, and
 * the probe detail says so.
 */
class NamespaceJailTier : public TierExecutor {
public:
    NamespaceJailTier(config::NamespaceJailTierConfig config,
                      std::filesystem::path scratchRoot);
    ~NamespaceJailTier() override;

    NamespaceJailTier(const NamespaceJailTier&) = delete;
    NamespaceJailTier& operator=(const NamespaceJailTier&) = delete;

    [[nodiscard]] auto descriptor() const -> TierDescriptor override;
    [[nodiscard]] auto supports(Language language) const -> bool override;
    [[nodiscard]] auto probe() noexcept -> bool override;
    [[nodiscard]] auto probeDetail() const -> std::string override;
    [[nodiscard]] auto execute(const ExecutionRequest& request,
                               std::stop_token stopToken)
        -> TierResult override;

    [[nodiscard]] static auto runningPrivileged() noexcept -> bool;

    /**
     * @brief Environment handed to jailed code
     */
    [[nodiscard]] static auto restrictedEnvironment(
        const std::filesystem::path& home) -> std::vector<std::string>;

    /**
     * @brief unshare + chroot command line for a prepared root
     * @param command Program and arguments as seen inside the root
     */
    [[nodiscard]] auto privilegedCommand(
        const std::string& unshare, const std::string& chroot,
        const std::filesystem::path& root,
        const std::vector<std::string>& command) const
        -> std::vector<std::string>;

    /**
     * @brief Rootless user, network, ipc and uts namespaces around a command
     */
    [[nodiscard]] static auto unprivilegedCommand(
        const std::string& unshare, const std::vector<std::string>& command)
        -> std::vector<std::string>;

    /**
     * @brief Resolve the real interpreter behind the configured name
     */
    [[nodiscard]] auto interpreter() -> std::optional<InterpreterInfo>;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIERS_NAMESPACE_JAIL_TIER_HPP
