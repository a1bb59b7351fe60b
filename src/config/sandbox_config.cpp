/*
 * sandbox_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sandbox_config.hpp"

#include <algorithm>
#include <fstream>

#include <spdlog/spdlog.h>

#include "sandbox/scratch.hpp"

namespace jailchain::config {

auto defaultRestrictedBuiltins() -> std::vector<std::string> {
    return {
        "abs",          "all",          "any",
        "ascii",        "bin",          "bool",
        "bytearray",    "bytes",        "callable",
        "chr",          "classmethod",  "complex",
        "dict",         "divmod",       "enumerate",
        "filter",       "float",        "format",
        "frozenset",    "hash",         "hex",
        "id",           "int",          "isinstance",
        "issubclass",   "iter",         "len",
        "list",         "map",          "max",
        "min",          "next",         "object",
        "oct",          "ord",          "pow",
        "print",        "property",     "range",
        "repr",         "reversed",     "round",
        "set",          "slice",        "sorted",
        "staticmethod", "str",          "sum",
        "super",        "tuple",        "type",
        "zip",
        // Class statements and the usual exception types
        "__build_class__",
        "Exception",    "ArithmeticError", "AssertionError",
        "AttributeError", "IndexError",  "KeyError",
        "LookupError",  "NameError",     "NotImplementedError",
        "OverflowError", "RuntimeError", "StopIteration",
        "TypeError",    "ValueError",    "ZeroDivisionError",
    };
}

// ============================================================================
// Tier sections
// ============================================================================

json ContainerTierConfig::toJson() const {
    return {{"enabled", enabled},
            {"dockerBinary", dockerBinary},
            {"imageTag", imageTag},
            {"baseImage", baseImage},
            {"tmpfsSizeMB", tmpfsSizeMB},
            {"probeTimeoutSeconds", probeTimeoutSeconds},
            {"buildTimeoutSeconds", buildTimeoutSeconds},
            {"limits", limits.toJson()}};
}

ContainerTierConfig ContainerTierConfig::fromJson(const json& j) {
    ContainerTierConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.dockerBinary = j.value("dockerBinary", cfg.dockerBinary);
    cfg.imageTag = j.value("imageTag", cfg.imageTag);
    cfg.baseImage = j.value("baseImage", cfg.baseImage);
    cfg.tmpfsSizeMB = j.value("tmpfsSizeMB", cfg.tmpfsSizeMB);
    cfg.probeTimeoutSeconds =
        j.value("probeTimeoutSeconds", cfg.probeTimeoutSeconds);
    cfg.buildTimeoutSeconds =
        j.value("buildTimeoutSeconds", cfg.buildTimeoutSeconds);
    if (j.contains("limits")) {
        cfg.limits = ResourceLimits::fromJson(j["limits"], cfg.limits);
    }
    return cfg;
}

json ProcessJailTierConfig::toJson() const {
    return {{"enabled", enabled},
            {"firejailBinary", firejailBinary},
            {"pythonCommand", pythonCommand},
            {"shellCommand", shellCommand},
            {"limits", limits.toJson()}};
}

ProcessJailTierConfig ProcessJailTierConfig::fromJson(const json& j) {
    ProcessJailTierConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.firejailBinary = j.value("firejailBinary", cfg.firejailBinary);
    cfg.pythonCommand = j.value("pythonCommand", cfg.pythonCommand);
    cfg.shellCommand = j.value("shellCommand", cfg.shellCommand);
    if (j.contains("limits")) {
        cfg.limits = ResourceLimits::fromJson(j["limits"], cfg.limits);
    }
    return cfg;
}

json NamespaceJailTierConfig::toJson() const {
    return {{"enabled", enabled},
            {"pythonExecutable", pythonExecutable},
            {"shellExecutable", shellExecutable},
            {"unshareBinary", unshareBinary},
            {"chrootBinary", chrootBinary},
            {"lddBinary", lddBinary},
            {"sandboxUid", sandboxUid},
            {"sandboxGid", sandboxGid},
            {"probeTimeoutSeconds", probeTimeoutSeconds},
            {"limits", limits.toJson()}};
}

NamespaceJailTierConfig NamespaceJailTierConfig::fromJson(const json& j) {
    NamespaceJailTierConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.pythonExecutable = j.value("pythonExecutable", cfg.pythonExecutable);
    cfg.shellExecutable = j.value("shellExecutable", cfg.shellExecutable);
    cfg.unshareBinary = j.value("unshareBinary", cfg.unshareBinary);
    cfg.chrootBinary = j.value("chrootBinary", cfg.chrootBinary);
    cfg.lddBinary = j.value("lddBinary", cfg.lddBinary);
    cfg.sandboxUid = j.value("sandboxUid", cfg.sandboxUid);
    cfg.sandboxGid = j.value("sandboxGid", cfg.sandboxGid);
    cfg.probeTimeoutSeconds =
        j.value("probeTimeoutSeconds", cfg.probeTimeoutSeconds);
    if (j.contains("limits")) {
        cfg.limits = ResourceLimits::fromJson(j["limits"], cfg.limits);
    }
    return cfg;
}

json RestrictedTierConfig::toJson() const {
    return {{"enabled", enabled},
            {"timeoutSeconds", timeoutSeconds},
            {"builtins", builtins}};
}

RestrictedTierConfig RestrictedTierConfig::fromJson(const json& j) {
    RestrictedTierConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    cfg.enabled = j.value("enabled", cfg.enabled);
    cfg.timeoutSeconds = j.value("timeoutSeconds", cfg.timeoutSeconds);
    if (j.contains("builtins") && j["builtins"].is_array()) {
        cfg.builtins = j["builtins"].get<std::vector<std::string>>();
    }
    return cfg;
}

json LocalTierConfig::toJson() const {
    return {{"pythonExecutable", pythonExecutable},
            {"shellExecutable", shellExecutable},
            {"timeoutSeconds", timeoutSeconds}};
}

LocalTierConfig LocalTierConfig::fromJson(const json& j) {
    LocalTierConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    cfg.pythonExecutable = j.value("pythonExecutable", cfg.pythonExecutable);
    cfg.shellExecutable = j.value("shellExecutable", cfg.shellExecutable);
    cfg.timeoutSeconds = j.value("timeoutSeconds", cfg.timeoutSeconds);
    return cfg;
}

// ============================================================================
// Chain and dependencies
// ============================================================================

json ChainConfig::toJson() const {
    return {{"order", order},
            {"containerReprobeSeconds", containerReprobeSeconds},
            {"backgroundProbe", backgroundProbe},
            {"promotePrivilegedNamespaceJail", promotePrivilegedNamespaceJail},
            {"scratchRoot", scratchRoot}};
}

ChainConfig ChainConfig::fromJson(const json& j) {
    ChainConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    if (j.contains("order") && j["order"].is_array()) {
        cfg.order = j["order"].get<std::vector<std::string>>();
    }
    cfg.containerReprobeSeconds =
        j.value("containerReprobeSeconds", cfg.containerReprobeSeconds);
    cfg.backgroundProbe = j.value("backgroundProbe", cfg.backgroundProbe);
    cfg.promotePrivilegedNamespaceJail = j.value(
        "promotePrivilegedNamespaceJail", cfg.promotePrivilegedNamespaceJail);
    cfg.scratchRoot = j.value("scratchRoot", cfg.scratchRoot);
    return cfg;
}

auto ChainConfig::scratchPath() const -> std::filesystem::path {
    if (!scratchRoot.empty()) {
        return scratchRoot;
    }
    return sandbox::ScratchDirectory::defaultRoot();
}

json DependencyConfig::toJson() const {
    return {{"pythonExecutable", pythonExecutable},
            {"installTimeoutSeconds", installTimeoutSeconds}};
}

DependencyConfig DependencyConfig::fromJson(const json& j) {
    DependencyConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    cfg.pythonExecutable = j.value("pythonExecutable", cfg.pythonExecutable);
    cfg.installTimeoutSeconds =
        j.value("installTimeoutSeconds", cfg.installTimeoutSeconds);
    return cfg;
}

// ============================================================================
// SandboxConfig
// ============================================================================

json SandboxConfig::toJson() const {
    return {{"policy", policy.toJson()},
            {"chain", chain.toJson()},
            {"tiers",
             {{"container", container.toJson()},
              {"processJail", processJail.toJson()},
              {"namespaceJail", namespaceJail.toJson()},
              {"restricted", restricted.toJson()},
              {"local", local.toJson()}}},
            {"dependencies", dependencies.toJson()},
            {"logging", logging.toJson()}};
}

SandboxConfig SandboxConfig::fromJson(const json& j) {
    SandboxConfig cfg;
    if (!j.is_object()) {
        return cfg;
    }
    if (j.contains("policy")) {
        cfg.policy = sandbox::SandboxPolicy::fromJson(j["policy"]);
    }
    if (j.contains("chain")) {
        cfg.chain = ChainConfig::fromJson(j["chain"]);
    }
    if (j.contains("tiers") && j["tiers"].is_object()) {
        const auto& tiers = j["tiers"];
        if (tiers.contains("container")) {
            cfg.container = ContainerTierConfig::fromJson(tiers["container"]);
        }
        if (tiers.contains("processJail")) {
            cfg.processJail =
                ProcessJailTierConfig::fromJson(tiers["processJail"]);
        }
        if (tiers.contains("namespaceJail")) {
            cfg.namespaceJail =
                NamespaceJailTierConfig::fromJson(tiers["namespaceJail"]);
        }
        if (tiers.contains("restricted")) {
            cfg.restricted = RestrictedTierConfig::fromJson(tiers["restricted"]);
        }
        if (tiers.contains("local")) {
            cfg.local = LocalTierConfig::fromJson(tiers["local"]);
        }
    }
    if (j.contains("dependencies")) {
        cfg.dependencies = DependencyConfig::fromJson(j["dependencies"]);
    }
    if (j.contains("logging")) {
        cfg.logging = logging::LoggingConfig::fromJson(j["logging"]);
    }
    return cfg;
}

auto SandboxConfig::validate() const -> std::expected<void, ConfigError> {
    if (chain.order.empty()) {
        spdlog::error("chain.order must name at least one tier");
        return std::unexpected(ConfigError::InvalidValue);
    }
    for (const auto& name : chain.order) {
        if (!sandbox::tierKindFromString(name)) {
            spdlog::error("Unknown tier '{}' in chain.order", name);
            return std::unexpected(ConfigError::InvalidValue);
        }
    }
    if (container.limits.cpuQuota < 0.0) {
        spdlog::error("tiers.container.limits.cpuQuota must not be negative");
        return std::unexpected(ConfigError::InvalidValue);
    }
    if (restricted.timeoutSeconds == 0 || local.timeoutSeconds == 0) {
        spdlog::error("Tier timeouts must be positive");
        return std::unexpected(ConfigError::InvalidValue);
    }
    return {};
}

auto SandboxConfig::tierOrder() const -> std::vector<sandbox::TierKind> {
    std::vector<sandbox::TierKind> order;
    for (const auto& name : chain.order) {
        auto kind = sandbox::tierKindFromString(name);
        if (kind && std::find(order.begin(), order.end(), *kind) == order.end()) {
            order.push_back(*kind);
        }
    }
    // Local is the terminal fallback whether listed or not
    if (std::find(order.begin(), order.end(), sandbox::TierKind::Local) ==
        order.end()) {
        order.push_back(sandbox::TierKind::Local);
    }
    return order;
}

auto SandboxConfig::load(const std::filesystem::path& path)
    -> std::expected<SandboxConfig, ConfigError> {
    std::ifstream file(path);
    if (!file) {
        spdlog::error("Configuration file not found: {}", path.string());
        return std::unexpected(ConfigError::FileNotFound);
    }

    json j;
    try {
        j = json::parse(file, nullptr, true, true);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::ParseError);
    }

    SandboxConfig cfg;
    try {
        cfg = fromJson(j);
    } catch (const json::exception& e) {
        spdlog::error("Invalid value in {}: {}", path.string(), e.what());
        return std::unexpected(ConfigError::InvalidValue);
    }

    if (auto valid = cfg.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return cfg;
}

}  // namespace jailchain::config
