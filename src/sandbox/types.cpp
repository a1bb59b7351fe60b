/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace jailchain::sandbox {

namespace {

auto toLower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

constexpr std::size_t kMiB = 1024 * 1024;

}  // namespace

auto parseLanguage(std::string_view tag) -> Language {
    const auto lower = toLower(tag);
    if (lower == "python" || lower == "python3" || lower == "py") {
        return Language::Python;
    }
    if (lower == "shell" || lower == "sh" || lower == "bash") {
        return Language::Shell;
    }
    return Language::Other;
}

auto tierKindFromString(std::string_view name) -> std::optional<TierKind> {
    const auto lower = toLower(name);
    if (lower == "container" || lower == "docker") {
        return TierKind::Container;
    }
    if (lower == "process_jail" || lower == "firejail") {
        return TierKind::ProcessJail;
    }
    if (lower == "namespace_jail" || lower == "namespace") {
        return TierKind::NamespaceJail;
    }
    if (lower == "restricted_interpreter" || lower == "restricted") {
        return TierKind::RestrictedInterpreter;
    }
    if (lower == "local") {
        return TierKind::Local;
    }
    return std::nullopt;
}

auto defaultTierOrder() -> std::vector<TierKind> {
    return {TierKind::Container, TierKind::ProcessJail, TierKind::NamespaceJail,
            TierKind::RestrictedInterpreter, TierKind::Local};
}

auto TierDescriptor::toJson() const -> json {
    return {{"kind", std::string(tierKindToString(kind))},
            {"name", name},
            {"icon", icon},
            {"label", label}};
}

auto describeTier(TierKind kind) -> TierDescriptor {
    switch (kind) {
        case TierKind::Container:
            return {kind, "container", "🐳", "Docker Sandbox"};
        case TierKind::ProcessJail:
            return {kind, "process_jail", "🔥", "Firejail Sandbox"};
        case TierKind::NamespaceJail:
            return {kind, "namespace_jail", "🐧", "Namespace Sandbox"};
        case TierKind::RestrictedInterpreter:
            return {kind, "restricted_interpreter", "🐍", "Python Sandbox"};
        case TierKind::Local:
            return {kind, "local", "💻", "Local Execution"};
    }
    return {kind, "unknown", "?", "Unknown"};
}

auto ResourceLimits::toJson() const -> json {
    return {{"maxWallSeconds", maxWall.count()},
            {"maxCpuSeconds", maxCpu.count()},
            {"maxMemoryMB", maxMemoryBytes / kMiB},
            {"maxFileSizeMB", maxFileSizeBytes / kMiB},
            {"maxProcesses", maxProcesses},
            {"cpuQuota", cpuQuota}};
}

auto ResourceLimits::fromJson(const json& j) -> ResourceLimits {
    return fromJson(j, ResourceLimits{});
}

auto ResourceLimits::fromJson(const json& j, const ResourceLimits& defaults)
    -> ResourceLimits {
    ResourceLimits limits = defaults;
    if (!j.is_object()) {
        return limits;
    }
    limits.maxWall = std::chrono::seconds(
        j.value("maxWallSeconds", defaults.maxWall.count()));
    limits.maxCpu = std::chrono::seconds(
        j.value("maxCpuSeconds", defaults.maxCpu.count()));
    limits.maxMemoryBytes =
        j.value("maxMemoryMB", defaults.maxMemoryBytes / kMiB) * kMiB;
    limits.maxFileSizeBytes =
        j.value("maxFileSizeMB", defaults.maxFileSizeBytes / kMiB) * kMiB;
    limits.maxProcesses = j.value("maxProcesses", defaults.maxProcesses);
    limits.cpuQuota = j.value("cpuQuota", defaults.cpuQuota);
    return limits;
}

auto ExecutionRequest::make(std::string code, std::string_view tag)
    -> ExecutionRequest {
    ExecutionRequest request;
    request.code = std::move(code);
    request.language = parseLanguage(tag);
    request.languageName = toLower(tag);
    if (request.languageName.empty()) {
        request.languageName = "python";
        request.language = Language::Python;
    }
    return request;
}

auto ExecutionRequest::fileExtension() const -> std::string {
    switch (language) {
        case Language::Python: return ".py";
        case Language::Shell: return ".sh";
        case Language::Other: break;
    }
    if (languageName == "javascript" || languageName == "node" ||
        languageName == "js") {
        return ".js";
    }
    if (languageName == "ruby") {
        return ".rb";
    }
    if (languageName == "perl") {
        return ".pl";
    }
    return ".txt";
}

auto TierAttempt::toJson() const -> json {
    return {{"tier", std::string(tierKindToString(tier))},
            {"errorKind", std::string(errorKindToString(kind))},
            {"detail", detail}};
}

auto ExecutionOutcome::toJson() const -> json {
    json j;
    j["text"] = text;
    j["tierUsed"] = tierUsed ? tierUsed->toJson() : json(nullptr);
    j["succeeded"] = succeeded();
    j["errorKind"] = std::string(errorKindToString(errorKind));
    j["exitCode"] = exitCode;
    j["elapsedMs"] = elapsed.count();
    j["attempts"] = json::array();
    for (const auto& attempt : attempts) {
        j["attempts"].push_back(attempt.toJson());
    }
    j["installedPackage"] =
        installedPackage ? json(*installedPackage) : json(nullptr);
    j["retried"] = retried;
    return j;
}

auto SandboxPolicy::excludes(TierKind kind) const -> bool {
    return std::find(excludedTiers.begin(), excludedTiers.end(), kind) !=
           excludedTiers.end();
}

auto SandboxPolicy::toJson() const -> json {
    json excluded = json::array();
    for (auto kind : excludedTiers) {
        excluded.push_back(std::string(tierKindToString(kind)));
    }
    return {{"preferLocal", preferLocal},
            {"allowAutoInstalls", allowAutoInstalls},
            {"allowAutoExec", allowAutoExec},
            {"showRawOutput", showRawOutput},
            {"excludedTiers", excluded}};
}

auto SandboxPolicy::fromJson(const json& j) -> SandboxPolicy {
    SandboxPolicy policy;
    if (!j.is_object()) {
        return policy;
    }
    policy.preferLocal = j.value("preferLocal", policy.preferLocal);
    policy.allowAutoInstalls =
        j.value("allowAutoInstalls", policy.allowAutoInstalls);
    policy.allowAutoExec = j.value("allowAutoExec", policy.allowAutoExec);
    policy.showRawOutput = j.value("showRawOutput", policy.showRawOutput);
    if (j.contains("excludedTiers") && j["excludedTiers"].is_array()) {
        for (const auto& name : j["excludedTiers"]) {
            if (!name.is_string()) {
                continue;
            }
            if (auto kind = tierKindFromString(name.get<std::string>())) {
                policy.excludedTiers.push_back(*kind);
            }
        }
    }
    return policy;
}

}  // namespace jailchain::sandbox
