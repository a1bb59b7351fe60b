/*
 * container_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "container_tier.hpp"

#include "sandbox/resource_limiter.hpp"
#include "sandbox/scratch.hpp"

#include <unistd.h>

#include <atomic>
#include <mutex>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

namespace fs = std::filesystem;

namespace {

constexpr auto kRemoveTimeout = std::chrono::seconds(15);
constexpr auto kInspectTimeout = std::chrono::seconds(30);
constexpr std::string_view kContainerHome = "/home/sandbox";

auto isDaemonUnreachable(std::string_view stderrText) -> bool {
    return stderrText.find("Cannot connect to the Docker daemon") !=
               std::string_view::npos ||
           stderrText.find("Is the docker daemon running") !=
               std::string_view::npos ||
           stderrText.find("error during connect") != std::string_view::npos;
}

auto hasDockerErrorSignature(std::string_view stderrText) -> bool {
    return stderrText.find("docker: ") != std::string_view::npos ||
           stderrText.find("Error response from daemon") !=
               std::string_view::npos ||
           stderrText.find("OCI runtime") != std::string_view::npos;
}

auto tail(const std::string& text, std::size_t max = 2000) -> std::string {
    if (text.size() <= max) {
        return text;
    }
    return "..." + text.substr(text.size() - max);
}

}  // namespace

class ContainerTier::Impl {
public:
    Impl(config::ContainerTierConfig config, fs::path scratchRoot)
        : config_(std::move(config)),
          scratchRoot_(std::move(scratchRoot)),
          limiter_(config_.limits) {}

    auto probe() -> bool {
        auto docker = process::findExecutable(config_.dockerBinary);
        if (!docker) {
            setDetail(fmt::format("'{}' not found on PATH",
                                  config_.dockerBinary));
            return false;
        }

        process::SpawnOptions options;
        options.argv = {docker->string(), "info", "--format",
                        "{{.ServerVersion}}"};
        options.timeout = std::chrono::seconds(config_.probeTimeoutSeconds);

        auto result = process::runProcess(options);
        if (!result) {
            setDetail(std::string(process::spawnErrorToString(result.error())));
            return false;
        }
        if (!result->success()) {
            setDetail(result->timedOut
                          ? std::string("docker info timed out")
                          : fmt::format("docker info failed: {}",
                                        tail(result->stderrText, 200)));
            return false;
        }

        auto version = result->stdoutText;
        while (!version.empty() &&
               (version.back() == '\n' || version.back() == '\r')) {
            version.pop_back();
        }
        setDetail("Docker daemon " + version);
        return true;
    }

    auto execute(const ExecutionRequest& request, std::stop_token stopToken)
        -> TierResult {
        auto docker = process::findExecutable(config_.dockerBinary);
        if (!docker) {
            return std::unexpected(TierFailure{
                ErrorKind::Unavailable,
                fmt::format("'{}' not found on PATH", config_.dockerBinary)});
        }
        dockerPath_ = docker->string();

        if (auto image = ensureImage(stopToken); !image) {
            return std::unexpected(image.error());
        }

        auto scratch = ScratchDirectory::create(scratchRoot_, "container");
        if (!scratch) {
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                "Failed to create scratch directory: " +
                    scratch.error().message()});
        }

        auto codeFile =
            scratch->writeFile("code" + request.fileExtension(), request.code);
        if (!codeFile) {
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                "Failed to write code file: " + codeFile.error().message()});
        }
        std::error_code ec;
        fs::permissions(*codeFile,
                        fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read,
                        ec);

        auto name = uniqueName();
        const auto marker = process::LaunchMarker::generate();
        process::SpawnOptions options;
        options.argv = runArguments(config_, request, *codeFile, name, marker);
        options.argv.front() = dockerPath_;
        options.timeout = config_.limits.maxWall;

        spdlog::info("Running code in container {} ({})", name,
                     config_.imageTag);
        auto result = process::runProcess(options, stopToken);
        if (!result) {
            return std::unexpected(TierFailure{
                ErrorKind::Unavailable,
                fmt::format("Failed to launch docker: {}",
                            process::spawnErrorToString(result.error()))});
        }

        if (result->timedOut || result->cancelled) {
            removeContainer(name);
        }

        if (!result->timedOut && !result->cancelled) {
            if (auto failure = classifyDockerFailure(*result, marker)) {
                if (failure->kind == ErrorKind::Unavailable) {
                    std::lock_guard lock(imageMutex_);
                    imageReady_ = false;
                }
                spdlog::warn("Docker failed to run container {}: {}", name,
                             failure->detail);
                return std::unexpected(*failure);
            }
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

    void invalidateImage() {
        std::lock_guard lock(imageMutex_);
        imageReady_ = false;
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
    auto ensureImage(std::stop_token stopToken)
        -> std::expected<void, TierFailure> {
        std::lock_guard lock(imageMutex_);
        if (imageReady_) {
            return {};
        }

        process::SpawnOptions inspect;
        inspect.argv = {dockerPath_, "image", "inspect", config_.imageTag};
        inspect.timeout = kInspectTimeout;
        auto inspected = process::runProcess(inspect, stopToken);
        if (inspected && inspected->success()) {
            spdlog::debug("Sandbox image {} already present", config_.imageTag);
            imageReady_ = true;
            return {};
        }
        if (inspected && isDaemonUnreachable(inspected->stderrText)) {
            return std::unexpected(
                TierFailure{ErrorKind::Unavailable, "Docker daemon unreachable"});
        }

        spdlog::info("Building sandbox image {} from {}", config_.imageTag,
                     config_.baseImage);
        process::SpawnOptions build;
        build.argv = {dockerPath_, "build", "-t", config_.imageTag, "-"};
        build.stdinData = dockerfile(config_);
        build.timeout = std::chrono::seconds(config_.buildTimeoutSeconds);
        auto built = process::runProcess(build, stopToken);
        if (!built) {
            return std::unexpected(TierFailure{
                ErrorKind::Unavailable,
                fmt::format("Failed to launch docker build: {}",
                            process::spawnErrorToString(built.error()))});
        }
        if (!built->success()) {
            if (isDaemonUnreachable(built->stderrText)) {
                return std::unexpected(TierFailure{ErrorKind::Unavailable,
                                                   "Docker daemon unreachable"});
            }
            spdlog::error("Failed to build sandbox image {}: {}",
                          config_.imageTag, tail(built->stderrText, 500));
            return std::unexpected(TierFailure{
                ErrorKind::RuntimeError,
                "Failed to build sandbox image: " + tail(built->stderrText)});
        }

        spdlog::info("Sandbox image {} built", config_.imageTag);
        imageReady_ = true;
        return {};
    }

    void removeContainer(const std::string& name) {
        process::SpawnOptions options;
        options.argv = {dockerPath_, "rm", "-f", name};
        options.timeout = kRemoveTimeout;
        auto removed = process::runProcess(options);
        if (!removed || !removed->success()) {
            spdlog::warn("Failed to remove container {}", name);
        } else {
            spdlog::debug("Removed container {}", name);
        }
    }

    auto uniqueName() -> std::string {
        auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
        return fmt::format("jailchain-{}-{}-{:x}", ::getpid(), ++counter_,
                           static_cast<unsigned long long>(ticks) & 0xffffff);
    }

    config::ContainerTierConfig config_;
    fs::path scratchRoot_;
    ResourceLimiter limiter_;
    std::string dockerPath_{"docker"};

    std::mutex imageMutex_;
    bool imageReady_{false};

    mutable std::mutex detailMutex_;
    std::string detail_{"not probed"};

    std::atomic<unsigned> counter_{0};
};

ContainerTier::ContainerTier(config::ContainerTierConfig config,
                             fs::path scratchRoot)
    : pImpl_(std::make_unique<Impl>(std::move(config), std::move(scratchRoot))) {
}

ContainerTier::~ContainerTier() = default;

auto ContainerTier::descriptor() const -> TierDescriptor {
    return describeTier(TierKind::Container);
}

auto ContainerTier::supports(Language language) const -> bool {
    return language == Language::Python || language == Language::Shell;
}

auto ContainerTier::probe() noexcept -> bool {
    try {
        return pImpl_->probe();
    } catch (const std::exception& e) {
        spdlog::warn("Container probe failed: {}", e.what());
        return false;
    }
}

auto ContainerTier::probeDetail() const -> std::string {
    return pImpl_->detail();
}

auto ContainerTier::execute(const ExecutionRequest& request,
                            std::stop_token stopToken) -> TierResult {
    try {
        return pImpl_->execute(request, stopToken);
    } catch (const std::exception& e) {
        spdlog::error("Container tier error: {}", e.what());
        return std::unexpected(TierFailure{ErrorKind::RuntimeError, e.what()});
    }
}

void ContainerTier::invalidateImage() { pImpl_->invalidateImage(); }

auto ContainerTier::dockerfile(const config::ContainerTierConfig& config)
    -> std::string {
    return fmt::format(
        "FROM {}\n"
        "RUN useradd --create-home --shell /bin/bash sandbox\n"
        "USER sandbox\n"
        "WORKDIR {}\n",
        config.baseImage, kContainerHome);
}

auto ContainerTier::runArguments(const config::ContainerTierConfig& config,
                                 const ExecutionRequest& request,
                                 const fs::path& hostCodeFile,
                                 const std::string& containerName,
                                 const process::LaunchMarker& marker)
    -> std::vector<std::string> {
    const std::string inside = fmt::format(
        "{}/{}", kContainerHome, hostCodeFile.filename().string());

    std::vector<std::string> args = {
        config.dockerBinary,
        "run",
        "--rm",
        "--name",
        containerName,
        "--network",
        "none",
        "--read-only",
        "--tmpfs",
        fmt::format("/tmp:rw,noexec,nosuid,size={}m", config.tmpfsSizeMB),
        "--cap-drop",
        "ALL",
        "--security-opt",
        "no-new-privileges"};

    auto limits = ResourceLimiter(config.limits).dockerArgs();
    args.insert(args.end(), limits.begin(), limits.end());

    args.insert(args.end(),
                {"-v", fmt::format("{}:{}:ro", hostCodeFile.string(), inside),
                 "-w", std::string(kContainerHome), config.imageTag});

    auto program =
        request.language == Language::Shell
            ? std::vector<std::string>{"sh", inside}
            : std::vector<std::string>{"python", inside};
    auto shim = marker.wrap(program);
    args.insert(args.end(), shim.begin(), shim.end());
    return args;
}

auto ContainerTier::classifyDockerFailure(const process::ProcessOutput& output,
                                          const process::LaunchMarker& marker)
    -> std::optional<TierFailure> {
    if (marker.reached(output)) {
        return std::nullopt;
    }
    if (isDaemonUnreachable(output.stderrText)) {
        return TierFailure{ErrorKind::Unavailable, "Docker daemon unreachable"};
    }
    // docker run passes the container's exit status through, so 125-127
    // are docker's own only when its runtime also reported an error
    if (output.exitCode < 125 || output.exitCode > 127 ||
        !hasDockerErrorSignature(output.stderrText)) {
        return std::nullopt;
    }
    if (output.exitCode == 125) {
        return TierFailure{ErrorKind::RuntimeError,
                           "docker run failed: " + tail(output.stderrText)};
    }
    return TierFailure{ErrorKind::RuntimeError,
                       "Container command failed: " + tail(output.stderrText)};
}

}  // namespace jailchain::sandbox
