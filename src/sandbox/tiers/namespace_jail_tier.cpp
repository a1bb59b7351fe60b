/*
 * namespace_jail_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "namespace_jail_tier.hpp"

#include "rootfs_builder.hpp"
#include "sandbox/process/launch_marker.hpp"
#include "sandbox/process/subprocess.hpp"
#include "sandbox/resource_limiter.hpp"
#include "sandbox/scratch.hpp"

#include <unistd.h>

#include <atomic>
#include <mutex>
#include <sstream>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

namespace fs = std::filesystem;

namespace {

constexpr auto kInterpreterQueryTimeout = std::chrono::seconds(10);
constexpr std::string_view kJailHome = "/home/sandbox";

constexpr std::string_view kInterpreterQuery =
    "import sys, sysconfig\n"
    "print(sys.executable)\n"
    "print(sysconfig.get_paths()['stdlib'])\n";

auto jailNeverStarted(const process::ProcessOutput& output,
                      const process::LaunchMarker& marker) -> bool {
    return !output.timedOut && !output.cancelled && !marker.reached(output);
}

}  // namespace

class NamespaceJailTier::Impl {
public:
    Impl(config::NamespaceJailTierConfig config, fs::path scratchRoot)
        : config_(std::move(config)),
          scratchRoot_(std::move(scratchRoot)),
          limiter_(config_.limits),
          builder_(config_.lddBinary) {}

    auto interpreter() -> std::optional<InterpreterInfo> {
        std::lock_guard lock(interpreterMutex_);
        if (interpreter_) {
            return interpreter_;
        }

        process::SpawnOptions options;
        options.argv = {config_.pythonExecutable, "-c",
                        std::string(kInterpreterQuery)};
        options.timeout = kInterpreterQueryTimeout;

        auto result = process::runProcess(options);
        if (!result || !result->success()) {
            spdlog::debug("Could not query interpreter '{}'",
                          config_.pythonExecutable);
            return std::nullopt;
        }

        std::istringstream lines(result->stdoutText);
        InterpreterInfo info;
        std::string executable;
        std::string stdlib;
        std::getline(lines, executable);
        std::getline(lines, stdlib);
        if (executable.empty()) {
            return std::nullopt;
        }
        info.executable = executable;
        info.stdlib = stdlib;
        spdlog::debug("Interpreter {} with stdlib {}", info.executable.string(),
                      info.stdlib.string());
        interpreter_ = info;
        return interpreter_;
    }

    auto probe() -> bool {
        if (runningPrivileged()) {
            return probePrivileged();
        }
        return probeUnprivileged();
    }

    auto execute(const ExecutionRequest& request, std::stop_token stopToken)
        -> TierResult {
        if (request.language != Language::Python &&
            request.language != Language::Shell) {
            return std::unexpected(TierFailure{
                ErrorKind::Unavailable,
                fmt::format("Language {} not supported in namespace sandbox",
                            request.languageName)});
        }
        if (runningPrivileged()) {
            return executePrivileged(request, stopToken);
        }
        return executeUnprivileged(request, stopToken);
    }

    auto privilegedCommand(const std::string& unshare, const std::string& chroot,
                           const fs::path& root,
                           const std::vector<std::string>& command) const
        -> std::vector<std::string> {
        std::vector<std::string> argv = {
            unshare,
            "--pid",
            "--fork",
            "--mount",
            "--mount-proc=" + (root / "proc").string(),
            "--net",
            "--ipc",
            "--uts",
            chroot,
            fmt::format("--userspec={}:{}", config_.sandboxUid,
                        config_.sandboxGid),
            root.string()};
        argv.insert(argv.end(), command.begin(), command.end());
        return argv;
    }

    void setDetail(std::string detail) {
        std::lock_guard lock(detailMutex_);
        detail_ = std::move(detail);
    }

    auto detail() const -> std::string {
        std::lock_guard lock(detailMutex_);
        return detail_;
    }

private:
    auto probePrivileged() -> bool {
        auto unshare = process::findExecutable(config_.unshareBinary);
        auto chroot = process::findExecutable(config_.chrootBinary);
        if (!unshare || !chroot) {
            setDetail("unshare or chroot not found on PATH");
            return false;
        }

        process::SpawnOptions options;
        options.argv = {unshare->string(), "--pid", "--fork", "--mount-proc",
                        "true"};
        options.timeout = std::chrono::seconds(config_.probeTimeoutSeconds);
        auto result = process::runProcess(options);
        if (!result || !result->success()) {
            setDetail("namespace creation failed");
            return false;
        }
        setDetail("privileged: namespaces + chroot");
        return true;
    }

    auto probeUnprivileged() -> bool {
        auto info = interpreter();
        if (!info) {
            setDetail(fmt::format("interpreter '{}' not usable",
                                  config_.pythonExecutable));
            return false;
        }

        auto scratch = ScratchDirectory::create(scratchRoot_, "nsjail-probe");
        if (!scratch) {
            setDetail("cannot create scratch directory");
            return false;
        }

        process::SpawnOptions options;
        options.argv = {info->executable.string(), "-c", "print('probe')"};
        options.env = restrictedEnvironment(scratch->path());
        options.workingDirectory = scratch->path();
        options.timeout = std::chrono::seconds(config_.probeTimeoutSeconds);
        auto result = process::runProcess(options);
        if (!result || !result->success() ||
            result->stdoutText.find("probe") == std::string::npos) {
            setDetail("restricted interpreter run failed");
            return false;
        }

        userNamespaces_ = probeUserNamespaces();
        setDetail(userNamespaces_
                      ? "unprivileged: user and network namespaces, "
                        "restricted working directory"
                      : "unprivileged: restricted working directory only "
                        "(user namespaces unavailable)");
        return true;
    }

    auto probeUserNamespaces() -> bool {
        auto unshare = process::findExecutable(config_.unshareBinary);
        if (!unshare) {
            return false;
        }
        process::SpawnOptions options;
        options.argv = unprivilegedCommand(unshare->string(), {"true"});
        options.timeout = std::chrono::seconds(config_.probeTimeoutSeconds);
        auto result = process::runProcess(options);
        bool ok = result && result->success();
        spdlog::debug("User namespaces {}", ok ? "available" : "unavailable");
        return ok;
    }

    auto executeUnprivileged(const ExecutionRequest& request,
                             std::stop_token stopToken) -> TierResult {
        fs::path program;
        if (request.language == Language::Python) {
            auto info = interpreter();
            if (!info) {
                return std::unexpected(TierFailure{
                    ErrorKind::Unavailable, "Python interpreter not found"});
            }
            program = info->executable;
        } else {
            auto shell = process::findExecutable(config_.shellExecutable);
            if (!shell) {
                return std::unexpected(
                    TierFailure{ErrorKind::Unavailable, "Shell not found"});
            }
            program = *shell;
        }

        auto scratch = ScratchDirectory::create(scratchRoot_, "nsjail-user");
        if (!scratch) {
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                "Failed to create sandbox directory: " +
                    scratch.error().message()});
        }
        auto codeFile =
            scratch->writeFile("code" + request.fileExtension(), request.code);
        if (!codeFile) {
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                "Failed to write code file: " + codeFile.error().message()});
        }

        std::vector<std::string> command = {program.string(),
                                            codeFile->string()};
        std::optional<process::LaunchMarker> marker;
        auto unshare = process::findExecutable(config_.unshareBinary);
        if (userNamespaces_ && unshare) {
            marker = process::LaunchMarker::generate();
            command = unprivilegedCommand(unshare->string(),
                                          marker->wrap(command));
        }

        process::SpawnOptions options;
        options.argv = std::move(command);
        options.env = restrictedEnvironment(scratch->path());
        options.workingDirectory = scratch->path();
        // RLIMIT_NPROC would count every process of the caller's uid
        options.limits = limiter_.childLimits(false);
        options.timeout = config_.limits.maxWall;

        spdlog::info("Running {} code in {} {}", request.languageName,
                     marker ? "user namespace jail" : "restricted directory",
                     scratch->path().string());
        auto result = process::runProcess(options, stopToken);
        if (!result) {
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                fmt::format("Failed to start {}: {}", options.argv.front(),
                            process::spawnErrorToString(result.error()))});
        }
        if (marker) {
            if (jailNeverStarted(*result, *marker)) {
                spdlog::warn("User namespace jail failed to start: {}",
                             result->stderrText);
                return std::unexpected(
                    TierFailure{ErrorKind::RuntimeError, result->stderrText});
            }
            marker->strip(*result);
        }
        return toRaw(*result);
    }

    auto executePrivileged(const ExecutionRequest& request,
                           std::stop_token stopToken) -> TierResult {
        auto unshare = process::findExecutable(config_.unshareBinary);
        auto chroot = process::findExecutable(config_.chrootBinary);
        if (!unshare || !chroot) {
            return std::unexpected(TierFailure{
                ErrorKind::Unavailable, "unshare or chroot not found on PATH"});
        }

        std::vector<fs::path> binaries = {"/bin/sh", "/bin/bash"};
        std::vector<fs::path> trees;
        fs::path program;
        if (request.language == Language::Python) {
            auto info = interpreter();
            if (!info) {
                return std::unexpected(TierFailure{
                    ErrorKind::Unavailable, "Python interpreter not found"});
            }
            program = info->executable;
            binaries.push_back(info->executable);
            if (!info->stdlib.empty()) {
                trees.push_back(info->stdlib);
            }
        } else {
            auto shell = process::findExecutable(config_.shellExecutable);
            program = shell ? *shell : fs::path("/bin/sh");
            binaries.push_back(program);
        }

        auto scratch = ScratchDirectory::create(scratchRoot_, "nsjail");
        if (!scratch) {
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                "Failed to create jail root: " + scratch.error().message()});
        }
        const auto& root = scratch->path();
        std::error_code ec;
        fs::permissions(root,
                        fs::perms::owner_all | fs::perms::group_read |
                            fs::perms::group_exec | fs::perms::others_read |
                            fs::perms::others_exec,
                        ec);

        if (auto built = builder_.build(root, binaries, trees); !built) {
            spdlog::error("Failed to build jail root: {}", built.error());
            return std::unexpected(
                TierFailure{ErrorKind::RuntimeError, built.error()});
        }

        const auto codeName = "code" + request.fileExtension();
        auto codeFile = scratch->writeFile(
            fs::path(kJailHome).relative_path() / codeName, request.code);
        if (!codeFile) {
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                "Failed to write code file: " + codeFile.error().message()});
        }
        fs::permissions(*codeFile,
                        fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read,
                        ec);
        auto home = root / fs::path(kJailHome).relative_path();
        if (::chown(home.c_str(), config_.sandboxUid, config_.sandboxGid) !=
            0) {
            spdlog::debug("Could not hand {} to uid {}", home.string(),
                          config_.sandboxUid);
        }

        const auto marker = process::LaunchMarker::generate();
        process::SpawnOptions options;
        options.argv = privilegedCommand(
            unshare->string(), chroot->string(), root,
            marker.wrap({program.string(),
                         (fs::path(kJailHome) / codeName).string()}));
        options.env = restrictedEnvironment(kJailHome);
        options.limits = limiter_.childLimits(true);
        options.timeout = config_.limits.maxWall;

        spdlog::info("Running {} code in namespace jail {}",
                     request.languageName, root.string());
        auto result = process::runProcess(options, stopToken);
        if (!result) {
            return std::unexpected(TierFailure{
                ErrorKind::Unavailable,
                fmt::format("Failed to start unshare: {}",
                            process::spawnErrorToString(result.error()))});
        }
        if (jailNeverStarted(*result, marker)) {
            spdlog::warn("Namespace jail failed to start: {}",
                         result->stderrText);
            return std::unexpected(
                TierFailure{ErrorKind::RuntimeError, result->stderrText});
        }
        marker.strip(*result);
        return toRaw(*result);
    }

    auto toRaw(process::ProcessOutput& output) const -> RawExecution {
        RawExecution raw;
        raw.kind = limiter_.classify(output);
        raw.stdoutText = std::move(output.stdoutText);
        raw.stderrText = std::move(output.stderrText);
        raw.exitCode = output.exitCode;
        raw.signal = output.termSignal;
        raw.elapsed = output.elapsed;
        if (raw.kind == ErrorKind::Timeout) {
            raw.detail = fmt::format("Execution timed out after {} seconds",
                                     config_.limits.maxWall.count());
        } else if (raw.kind == ErrorKind::ResourceLimit) {
            raw.detail = limiter_.describeViolation(output);
        }
        return raw;
    }

    config::NamespaceJailTierConfig config_;
    fs::path scratchRoot_;
    ResourceLimiter limiter_;
    RootfsBuilder builder_;

    std::mutex interpreterMutex_;
    std::optional<InterpreterInfo> interpreter_;
    std::atomic<bool> userNamespaces_{false};

    mutable std::mutex detailMutex_;
    std::string detail_{"not probed"};
};

NamespaceJailTier::NamespaceJailTier(config::NamespaceJailTierConfig config,
                                     fs::path scratchRoot)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(scratchRoot))) {
}

NamespaceJailTier::~NamespaceJailTier() = default;

auto NamespaceJailTier::descriptor() const -> TierDescriptor {
    return describeTier(TierKind::NamespaceJail);
}

auto NamespaceJailTier::supports(Language language) const -> bool {
    return language == Language::Python || language == Language::Shell;
}

auto NamespaceJailTier::probe() noexcept -> bool {
    try {
        return pImpl_->probe();
    } catch (const std::exception& e) {
        spdlog::warn("Namespace jail probe failed: {}", e.what());
        return false;
    }
}

auto NamespaceJailTier::probeDetail() const -> std::string {
    return pImpl_->detail();
}

auto NamespaceJailTier::execute(const ExecutionRequest& request,
                                std::stop_token stopToken) -> TierResult {
    try {
        return pImpl_->execute(request, stopToken);
    } catch (const std::exception& e) {
        spdlog::error("Namespace jail error: {}", e.what());
        return std::unexpected(TierFailure{ErrorKind::RuntimeError, e.what()});
    }
}

auto NamespaceJailTier::runningPrivileged() noexcept -> bool {
    return ::geteuid() == 0;
}

auto NamespaceJailTier::restrictedEnvironment(const fs::path& home)
    -> std::vector<std::string> {
    return {"PATH=/usr/bin:/bin",
            "HOME=" + home.string(),
            "USER=sandbox",
            "SHELL=/bin/sh",
            "LANG=C.UTF-8",
            "PYTHONPATH=",
            "PYTHONDONTWRITEBYTECODE=1",
            "PYTHONUNBUFFERED=1",
            "PYTHONNOUSERSITE=1"};
}

auto NamespaceJailTier::privilegedCommand(
    const std::string& unshare, const std::string& chroot, const fs::path& root,
    const std::vector<std::string>& command) const -> std::vector<std::string> {
    return pImpl_->privilegedCommand(unshare, chroot, root, command);
}

auto NamespaceJailTier::unprivilegedCommand(
    const std::string& unshare, const std::vector<std::string>& command)
    -> std::vector<std::string> {
    std::vector<std::string> argv = {unshare,       "--user", "--map-root-user",
                                     "--net",       "--ipc",  "--uts"};
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

auto NamespaceJailTier::interpreter() -> std::optional<InterpreterInfo> {
    return pImpl_->interpreter();
}

}  // namespace jailchain::sandbox
