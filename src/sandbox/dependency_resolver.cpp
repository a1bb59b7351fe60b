/*
 * dependency_resolver.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "dependency_resolver.hpp"

#include "process/subprocess.hpp"

#include <regex>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

// ============================================================================
// PipInstaller
// ============================================================================

PipInstaller::PipInstaller(std::string pythonExecutable,
                           std::chrono::seconds timeout)
    : python_(std::move(pythonExecutable)), timeout_(timeout) {}

auto PipInstaller::command(const std::string& package) const
    -> std::vector<std::string> {
    return {python_, "-m", "pip", "install", "--disable-pip-version-check",
            package};
}

auto PipInstaller::install(const std::string& package)
    -> std::expected<void, std::string> {
    process::SpawnOptions options;
    options.argv = command(package);
    options.timeout = timeout_;

    spdlog::info("Installing missing package '{}'", package);
    auto result = process::runProcess(options);
    if (!result) {
        return std::unexpected(
            fmt::format("could not start pip: {}",
                        process::spawnErrorToString(result.error())));
    }
    if (result->timedOut) {
        return std::unexpected(fmt::format("pip timed out after {} seconds",
                                           timeout_.count()));
    }
    if (!result->success()) {
        return std::unexpected(
            fmt::format("pip exited with code {}: {}", result->exitCode,
                        result->stderrText));
    }
    return {};
}

// ============================================================================
// DependencyResolver
// ============================================================================

DependencyResolver::DependencyResolver(
    const SandboxPolicy& policy, std::shared_ptr<PackageInstaller> installer)
    : policy_(policy), installer_(std::move(installer)) {}

auto DependencyResolver::installsAllowed() const noexcept -> bool {
    return policy_.allowAutoInstalls && policy_.allowAutoExec &&
           installer_ != nullptr;
}

auto DependencyResolver::findMissingModule(std::string_view text)
    -> std::optional<std::string> {
    static const std::regex pattern(
        R"(No module named ['"]([A-Za-z0-9_\-\.]+)['"])");

    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(text.begin(), text.end(), match, pattern)) {
        return std::nullopt;
    }

    std::string module = match[1].str();
    if (auto dot = module.find('.'); dot != std::string::npos) {
        module.erase(dot);
    }
    if (module.empty()) {
        return std::nullopt;
    }
    return module;
}

auto DependencyResolver::run(const Attempt& attempt) -> ExecutionOutcome {
    auto outcome = attempt();
    if (outcome.errorKind == ErrorKind::Cancelled) {
        return outcome;
    }

    auto missing = findMissingModule(outcome.text);
    if (!missing) {
        return outcome;
    }

    outcome.errorKind = ErrorKind::Transient;
    if (!installsAllowed()) {
        spdlog::info("Module '{}' is missing; automatic installs are disabled",
                     *missing);
        outcome.text += fmt::format(
            "\n\nNote: module '{}' is not installed. Enable automatic "
            "installs to fetch it.",
            *missing);
        return outcome;
    }

    ++installs_;
    auto installed = installer_->install(*missing);
    if (!installed) {
        spdlog::warn("Install of '{}' failed: {}", *missing, installed.error());
        outcome.text += fmt::format(
            "\n\nNote: automatic install of '{}' failed: {}", *missing,
            installed.error());
        return outcome;
    }

    spdlog::info("Installed '{}'; re-running the tier chain once", *missing);
    auto retried = attempt();
    retried.installedPackage = *missing;
    retried.retried = true;

    if (retried.errorKind != ErrorKind::Cancelled &&
        findMissingModule(retried.text)) {
        retried.errorKind = ErrorKind::Transient;
        retried.text += fmt::format(
            "\n\nNote: installed '{}' but a module is still missing; not "
            "retrying again.",
            *missing);
    }
    return retried;
}

}  // namespace jailchain::sandbox
