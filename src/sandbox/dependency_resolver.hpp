/*
 * dependency_resolver.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file dependency_resolver.hpp
 * @brief One-shot install and retry for missing Python modules
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_DEPENDENCY_RESOLVER_HPP
#define JAILCHAIN_SANDBOX_DEPENDENCY_RESOLVER_HPP

#include "types.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Installs a named package into the execution environment
 */
class PackageInstaller {
public:
    virtual ~PackageInstaller() = default;

    /**
     * @brief Install @p package; the error carries the installer output
     */
    virtual auto install(const std::string& package)
        -> std::expected<void, std::string> = 0;
};

/**
 * @brief Runs `<python> -m pip install <package>`
 */
class PipInstaller : public PackageInstaller {
public:
    explicit PipInstaller(std::string pythonExecutable = "python3",
                          std::chrono::seconds timeout = std::chrono::seconds{300});

    auto install(const std::string& package)
        -> std::expected<void, std::string> override;

    [[nodiscard]] auto command(const std::string& package) const
        -> std::vector<std::string>;

private:
    std::string python_;
    std::chrono::seconds timeout_;
};

/**
 * @brief Detects missing-module failures and retries the chain once
 *
 * At most one install and one re-run happen per request, and only when
 * the policy allows both installs and automatic execution.
 */
class DependencyResolver {
public:
    using Attempt = std::function<ExecutionOutcome()>;

    DependencyResolver(const SandboxPolicy& policy,
                       std::shared_ptr<PackageInstaller> installer);

    /**
     * @brief Run @p attempt, installing and re-running once if needed
     */
    [[nodiscard]] auto run(const Attempt& attempt) -> ExecutionOutcome;

    /**
     * @brief Top-level module named in a "No module named 'x'" message
     */
    [[nodiscard]] static auto findMissingModule(std::string_view text)
        -> std::optional<std::string>;

    [[nodiscard]] auto installCount() const noexcept -> std::size_t {
        return installs_;
    }

private:
    [[nodiscard]] auto installsAllowed() const noexcept -> bool;

    const SandboxPolicy& policy_;
    std::shared_ptr<PackageInstaller> installer_;
    std::size_t installs_{0};
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_DEPENDENCY_RESOLVER_HPP
