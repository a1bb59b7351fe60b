/*
 * resource_limiter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_limiter.hpp"

#include <algorithm>
#include <csignal>

#include <spdlog/fmt/fmt.h>

namespace jailchain::sandbox {

namespace {

constexpr std::size_t kMiB = 1024 * 1024;

auto clampToHard(int resource, rlim_t wanted) -> process::ChildLimit {
    struct rlimit current {};
    if (::getrlimit(resource, &current) != 0) {
        return {resource, wanted, wanted};
    }
    rlim_t hard = current.rlim_max;
    rlim_t soft = (hard == RLIM_INFINITY || wanted <= hard) ? wanted : hard;
    return {resource, soft, hard == RLIM_INFINITY ? soft : std::min(soft, hard)};
}

auto exitSignalCode(int sig) -> int { return 128 + sig; }

}  // namespace

ResourceLimiter::ResourceLimiter(ResourceLimits limits)
    : limits_(std::move(limits)) {}

auto ResourceLimiter::childLimits(bool includeProcessLimit) const
    -> std::vector<process::ChildLimit> {
    std::vector<process::ChildLimit> result;

    if (limits_.maxMemoryBytes > 0) {
        result.push_back(clampToHard(RLIMIT_AS, limits_.maxMemoryBytes));
    }

    if (limits_.maxCpu.count() > 0) {
        // Soft limit delivers SIGXCPU, hard limit one second later SIGKILL
        auto cpu = static_cast<rlim_t>(limits_.maxCpu.count());
        auto limit = clampToHard(RLIMIT_CPU, cpu + 1);
        limit.soft = std::min<rlim_t>(cpu, limit.hard);
        result.push_back(limit);
    }

    if (limits_.maxFileSizeBytes > 0) {
        result.push_back(clampToHard(RLIMIT_FSIZE, limits_.maxFileSizeBytes));
    }

    if (includeProcessLimit && limits_.maxProcesses > 0) {
        result.push_back(clampToHard(RLIMIT_NPROC, limits_.maxProcesses));
    }

    return result;
}

auto ResourceLimiter::firejailArgs() const -> std::vector<std::string> {
    std::vector<std::string> args;
    if (limits_.maxMemoryBytes > 0) {
        args.push_back(fmt::format("--rlimit-as={}", limits_.maxMemoryBytes));
    }
    if (limits_.maxCpu.count() > 0) {
        args.push_back(fmt::format("--rlimit-cpu={}", limits_.maxCpu.count()));
    }
    if (limits_.maxFileSizeBytes > 0) {
        args.push_back(
            fmt::format("--rlimit-fsize={}", limits_.maxFileSizeBytes));
    }
    if (limits_.maxProcesses > 0) {
        args.push_back(
            fmt::format("--rlimit-nproc={}", limits_.maxProcesses));
    }
    args.emplace_back("--cpu=0");
    return args;
}

auto ResourceLimiter::dockerArgs() const -> std::vector<std::string> {
    std::vector<std::string> args;
    if (limits_.maxMemoryBytes > 0) {
        auto memory = fmt::format("{}m", std::max<std::size_t>(
                                             1, limits_.maxMemoryBytes / kMiB));
        args.insert(args.end(), {"--memory", memory, "--memory-swap", memory});
    }
    if (limits_.cpuQuota > 0.0) {
        args.insert(args.end(),
                    {"--cpus", fmt::format("{:.2f}", limits_.cpuQuota)});
    }
    if (limits_.maxProcesses > 0) {
        args.insert(args.end(),
                    {"--pids-limit", std::to_string(limits_.maxProcesses)});
    }
    if (limits_.maxFileSizeBytes > 0) {
        args.insert(args.end(),
                    {"--ulimit", fmt::format("fsize={0}:{0}",
                                             limits_.maxFileSizeBytes)});
    }
    if (limits_.maxCpu.count() > 0) {
        args.insert(args.end(),
                    {"--ulimit", fmt::format("cpu={}:{}", limits_.maxCpu.count(),
                                             limits_.maxCpu.count() + 1)});
    }
    return args;
}

auto ResourceLimiter::classify(const process::ProcessOutput& output) const
    -> ErrorKind {
    if (output.cancelled) {
        return ErrorKind::Cancelled;
    }
    if (output.timedOut) {
        return ErrorKind::Timeout;
    }
    switch (output.termSignal) {
        case SIGXCPU:
        case SIGXFSZ:
        case SIGKILL:
            return ErrorKind::ResourceLimit;
        default:
            break;
    }
    if (output.exitCode == exitSignalCode(SIGKILL) ||
        output.exitCode == exitSignalCode(SIGXCPU) ||
        output.exitCode == exitSignalCode(SIGXFSZ)) {
        return ErrorKind::ResourceLimit;
    }
    if (output.exitCode != 0 &&
        output.stderrText.find("MemoryError") != std::string::npos) {
        return ErrorKind::ResourceLimit;
    }
    return ErrorKind::None;
}

auto ResourceLimiter::describeViolation(
    const process::ProcessOutput& output) const -> std::string {
    int sig = output.termSignal != 0 ? output.termSignal
                                     : (output.exitCode > 128
                                            ? output.exitCode - 128
                                            : 0);
    if (sig == SIGXCPU) {
        return fmt::format("CPU time limit of {} seconds exceeded",
                           limits_.maxCpu.count());
    }
    if (sig == SIGXFSZ) {
        return fmt::format("File size limit of {} MB exceeded",
                           limits_.maxFileSizeBytes / kMiB);
    }
    if (sig == SIGKILL) {
        return fmt::format("Process killed (memory limit {} MB or CPU limit)",
                           limits_.maxMemoryBytes / kMiB);
    }
    return fmt::format("Memory limit of {} MB exceeded",
                       limits_.maxMemoryBytes / kMiB);
}

}  // namespace jailchain::sandbox
