/*
 * process_jail_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "process_jail_tier.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

ProcessJailTier::ProcessJailTier(config::ProcessJailTierConfig config)
    : config_(std::move(config)), limiter_(config_.limits) {}

auto ProcessJailTier::descriptor() const -> TierDescriptor {
    return describeTier(TierKind::ProcessJail);
}

auto ProcessJailTier::supports(Language) const -> bool { return true; }

auto ProcessJailTier::probe() noexcept -> bool {
    try {
        auto firejail = process::findExecutable(config_.firejailBinary);
        if (!firejail) {
            setDetail(fmt::format("'{}' not found on PATH",
                                  config_.firejailBinary));
            return false;
        }
        setDetail("firejail at " + firejail->string());
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Firejail probe failed: {}", e.what());
        return false;
    }
}

auto ProcessJailTier::probeDetail() const -> std::string {
    std::lock_guard lock(detailMutex_);
    return detail_;
}

void ProcessJailTier::setDetail(std::string detail) {
    std::lock_guard lock(detailMutex_);
    detail_ = std::move(detail);
}

auto ProcessJailTier::buildCommand(const std::string& firejail,
                                   const ExecutionRequest& request,
                                   const process::LaunchMarker& marker) const
    -> std::vector<std::string> {
    std::vector<std::string> cmd = {firejail,
                                    "--quiet",
                                    "--noprofile",
                                    "--private",
                                    "--private-dev",
                                    "--private-etc",
                                    "--noexec=/tmp",
                                    "--noexec=/var",
                                    "--noexec=/home",
                                    "--read-only=/",
                                    "--whitelist=/usr",
                                    "--whitelist=/lib",
                                    "--whitelist=/lib64",
                                    "--whitelist=/bin",
                                    "--whitelist=/sbin",
                                    "--tmpfs=/tmp",
                                    "--net=none"};

    auto limits = limiter_.firejailArgs();
    cmd.insert(cmd.end(), limits.begin(), limits.end());

    std::vector<std::string> program;
    switch (request.language) {
        case Language::Python:
            program = {config_.pythonCommand, "-"};
            break;
        case Language::Shell:
            program = {config_.shellCommand, "-s"};
            break;
        case Language::Other:
            program = {request.languageName, "-"};
            break;
    }
    auto shim = marker.wrap(program);
    cmd.insert(cmd.end(), shim.begin(), shim.end());
    return cmd;
}

auto ProcessJailTier::isLaunchFailure(const process::ProcessOutput& output,
                                      const process::LaunchMarker& marker)
    -> bool {
    return !output.timedOut && !output.cancelled && !marker.reached(output);
}

auto ProcessJailTier::execute(const ExecutionRequest& request,
                              std::stop_token stopToken) -> TierResult {
    auto firejail = process::findExecutable(config_.firejailBinary);
    if (!firejail) {
        return std::unexpected(TierFailure{
            ErrorKind::Unavailable,
            "Firejail is not installed or not found in PATH"});
    }

    const auto marker = process::LaunchMarker::generate();
    process::SpawnOptions options;
    options.argv = buildCommand(firejail->string(), request, marker);
    options.stdinData = request.code;
    options.timeout = config_.limits.maxWall;

    spdlog::info("Running {} code under firejail", request.languageName);
    auto result = process::runProcess(options, stopToken);
    if (!result) {
        return std::unexpected(TierFailure{
            ErrorKind::Unavailable,
            fmt::format("Firejail execution failed: {}",
                        process::spawnErrorToString(result.error()))});
    }

    if (isLaunchFailure(*result, marker)) {
        spdlog::warn("Firejail refused to start: {}", result->stderrText);
        return std::unexpected(TierFailure{
            ErrorKind::RuntimeError,
            "Firejail execution failed: " + result->stderrText});
    }
    marker.strip(*result);

    RawExecution raw;
    raw.kind = limiter_.classify(*result);
    raw.stdoutText = std::move(result->stdoutText);
    raw.stderrText = std::move(result->stderrText);
    raw.exitCode = result->exitCode;
    raw.signal = result->termSignal;
    raw.elapsed = result->elapsed;
    if (raw.kind == ErrorKind::Timeout) {
        raw.detail = fmt::format("Execution timed out after {} seconds",
                                 config_.limits.maxWall.count());
    } else if (raw.kind == ErrorKind::ResourceLimit) {
        raw.detail = limiter_.describeViolation(*result);
    }
    return raw;
}

}  // namespace jailchain::sandbox
