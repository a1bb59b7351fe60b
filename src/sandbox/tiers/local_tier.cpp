/*
 * local_tier.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "local_tier.hpp"

#include "sandbox/process/subprocess.hpp"
#include "sandbox/scratch.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace jailchain::sandbox {

LocalTier::LocalTier(config::LocalTierConfig config,
                     std::filesystem::path scratchRoot, LocalRunner runner)
    : config_(std::move(config)),
      scratchRoot_(std::move(scratchRoot)),
      runner_(std::move(runner)) {}

void LocalTier::setRunner(LocalRunner runner) { runner_ = std::move(runner); }

auto LocalTier::descriptor() const -> TierDescriptor {
    return describeTier(TierKind::Local);
}

auto LocalTier::supports(Language) const -> bool { return true; }

auto LocalTier::probe() noexcept -> bool { return true; }

auto LocalTier::probeDetail() const -> std::string {
    return runner_ ? "caller-supplied runner (no isolation)"
                   : "direct subprocess (no isolation)";
}

auto LocalTier::interpreterFor(const ExecutionRequest& request) const
    -> std::string {
    switch (request.language) {
        case Language::Python: return config_.pythonExecutable;
        case Language::Shell: return config_.shellExecutable;
        case Language::Other: break;
    }
    return request.languageName;
}

auto LocalTier::execute(const ExecutionRequest& request,
                        std::stop_token stopToken) -> TierResult {
    if (runner_) {
        try {
            return runner_(request, stopToken);
        } catch (const std::exception& e) {
            spdlog::error("Local runner threw: {}", e.what());
            return std::unexpected(
                TierFailure{ErrorKind::RuntimeError, e.what()});
        }
    }
    return runDirect(request, stopToken);
}

auto LocalTier::runDirect(const ExecutionRequest& request,
                          std::stop_token stopToken) -> TierResult {
    auto scratch = ScratchDirectory::create(scratchRoot_, "local");
    if (!scratch) {
        return std::unexpected(TierFailure{
            ErrorKind::RuntimeError,
            "Failed to create working directory: " + scratch.error().message()});
    }
    auto codeFile =
        scratch->writeFile("code" + request.fileExtension(), request.code);
    if (!codeFile) {
        return std::unexpected(TierFailure{
            ErrorKind::RuntimeError,
            "Failed to write code file: " + codeFile.error().message()});
    }

    const auto interpreter = interpreterFor(request);
    process::SpawnOptions options;
    options.argv = {interpreter, codeFile->string()};
    options.workingDirectory = scratch->path();
    options.timeout = std::chrono::seconds(config_.timeoutSeconds);

    spdlog::info("Running {} code locally with {}", request.languageName,
                 interpreter);
    auto result = process::runProcess(options, stopToken);
    if (!result) {
        return std::unexpected(TierFailure{
            ErrorKind::RuntimeError,
            fmt::format("Failed to start '{}': {}", interpreter,
                        process::spawnErrorToString(result.error()))});
    }

    // No limits are applied here, so only timeouts and cancellation count
    RawExecution raw;
    if (result->cancelled) {
        raw.kind = ErrorKind::Cancelled;
    } else if (result->timedOut) {
        raw.kind = ErrorKind::Timeout;
    }
    raw.stdoutText = std::move(result->stdoutText);
    raw.stderrText = std::move(result->stderrText);
    raw.exitCode = result->exitCode;
    raw.signal = result->termSignal;
    raw.elapsed = result->elapsed;
    if (raw.kind == ErrorKind::Timeout) {
        raw.detail = fmt::format("Execution timed out after {} seconds",
                                 config_.timeoutSeconds);
    }
    return raw;
}

}  // namespace jailchain::sandbox
