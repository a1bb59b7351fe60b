/*
 * sandbox_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Sandbox fallback chain configuration

**************************************************/

#ifndef JAILCHAIN_CONFIG_SANDBOX_CONFIG_HPP
#define JAILCHAIN_CONFIG_SANDBOX_CONFIG_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging/logging.hpp"
#include "sandbox/types.hpp"

namespace jailchain::config {

using json = nlohmann::json;
using sandbox::ResourceLimits;

/**
 * @brief Error codes for configuration loading
 */
enum class ConfigError { FileNotFound, ParseError, InvalidValue };

[[nodiscard]] constexpr std::string_view configErrorToString(
    ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "Configuration file not found";
        case ConfigError::ParseError: return "Configuration parse error";
        case ConfigError::InvalidValue: return "Invalid configuration value";
    }
    return "Unknown";
}

/**
 * @brief Builtins exposed by the restricted interpreter
 */
[[nodiscard]] auto defaultRestrictedBuiltins() -> std::vector<std::string>;

/**
 * @brief Docker container tier configuration
 */
struct ContainerTierConfig {
    bool enabled{true};
    std::string dockerBinary{"docker"};       ///< Docker CLI name or path
    std::string imageTag{"jailchain-sandbox"};
    std::string baseImage{"python:3.11-slim"};
    size_t tmpfsSizeMB{16};                   ///< Size of the private /tmp
    size_t probeTimeoutSeconds{5};
    size_t buildTimeoutSeconds{600};
    ResourceLimits limits{};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static ContainerTierConfig fromJson(const json& j);
};

/**
 * @brief Firejail tier configuration
 */
struct ProcessJailTierConfig {
    bool enabled{true};
    std::string firejailBinary{"firejail"};
    std::string pythonCommand{"python3"};
    std::string shellCommand{"bash"};
    ResourceLimits limits{};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static ProcessJailTierConfig fromJson(const json& j);
};

/**
 * @brief Namespace + chroot tier configuration
 */
struct NamespaceJailTierConfig {
    bool enabled{true};
    std::string pythonExecutable{"python3"};  ///< Resolved on PATH
    std::string shellExecutable{"/bin/bash"};
    std::string unshareBinary{"unshare"};
    std::string chrootBinary{"chroot"};
    std::string lddBinary{"ldd"};
    unsigned sandboxUid{65534};               ///< Identity inside the chroot
    unsigned sandboxGid{65534};
    size_t probeTimeoutSeconds{5};
    ResourceLimits limits{};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static NamespaceJailTierConfig fromJson(const json& j);
};

/**
 * @brief Restricted in-process interpreter configuration
 */
struct RestrictedTierConfig {
    bool enabled{true};
    size_t timeoutSeconds{30};
    std::vector<std::string> builtins{defaultRestrictedBuiltins()};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static RestrictedTierConfig fromJson(const json& j);
};

/**
 * @brief Unisolated local execution configuration
 */
struct LocalTierConfig {
    std::string pythonExecutable{"python3"};
    std::string shellExecutable{"bash"};
    size_t timeoutSeconds{30};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static LocalTierConfig fromJson(const json& j);
};

/**
 * @brief Tier chain configuration
 */
struct ChainConfig {
    std::vector<std::string> order{"container", "process_jail",
                                   "namespace_jail", "restricted_interpreter",
                                   "local"};
    size_t containerReprobeSeconds{300};
    bool backgroundProbe{false};              ///< Re-probe docker periodically
    bool promotePrivilegedNamespaceJail{true};
    std::string scratchRoot;                  ///< Empty = <tmp>/jailchain

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static ChainConfig fromJson(const json& j);

    [[nodiscard]] auto scratchPath() const -> std::filesystem::path;
};

/**
 * @brief Automatic dependency installation configuration
 */
struct DependencyConfig {
    std::string pythonExecutable{"python3"};
    size_t installTimeoutSeconds{300};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static DependencyConfig fromJson(const json& j);
};

/**
 * @brief Complete jailchain configuration
 */
struct SandboxConfig {
    sandbox::SandboxPolicy policy{};
    ChainConfig chain{};
    ContainerTierConfig container{};
    ProcessJailTierConfig processJail{};
    NamespaceJailTierConfig namespaceJail{};
    RestrictedTierConfig restricted{};
    LocalTierConfig local{};
    DependencyConfig dependencies{};
    logging::LoggingConfig logging{};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static SandboxConfig fromJson(const json& j);

    /**
     * @brief Check cross-field constraints
     */
    [[nodiscard]] auto validate() const -> std::expected<void, ConfigError>;

    /**
     * @brief Resolved chain order
     */
    [[nodiscard]] auto tierOrder() const -> std::vector<sandbox::TierKind>;

    /**
     * @brief Load and validate a JSON configuration file
     */
    [[nodiscard]] static auto load(const std::filesystem::path& path)
        -> std::expected<SandboxConfig, ConfigError>;
};

}  // namespace jailchain::config

#endif  // JAILCHAIN_CONFIG_SANDBOX_CONFIG_HPP
