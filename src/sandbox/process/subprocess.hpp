/*
 * subprocess.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file subprocess.hpp
 * @brief Supervised child process execution
 * @date 2024
 * @version 1.0.0
 *
 * Spawns a child with piped stdio, optional stdin payload, environment and
 * working directory, applies resource limits in the child before exec, and
 * supervises it against a wall-clock deadline and a stop token. The child
 * leads its own process group so the whole group is killed on timeout or
 * cancellation.
 */

#ifndef JAILCHAIN_SANDBOX_PROCESS_SUBPROCESS_HPP
#define JAILCHAIN_SANDBOX_PROCESS_SUBPROCESS_HPP

#include <sys/resource.h>

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace jailchain::sandbox::process {

/**
 * @brief Error codes for process spawning
 */
enum class SpawnError {
    InvalidArguments,
    PipeFailed,
    ForkFailed,
    ExecFailed,
    WaitFailed
};

[[nodiscard]] constexpr std::string_view spawnErrorToString(
    SpawnError error) noexcept {
    switch (error) {
        case SpawnError::InvalidArguments: return "Invalid arguments";
        case SpawnError::PipeFailed: return "Pipe creation failed";
        case SpawnError::ForkFailed: return "Fork failed";
        case SpawnError::ExecFailed: return "Exec failed";
        case SpawnError::WaitFailed: return "Wait failed";
    }
    return "Unknown";
}

template <typename T>
using Result = std::expected<T, SpawnError>;

/**
 * @brief A resource limit applied in the child before exec
 */
struct ChildLimit {
    int resource{RLIMIT_AS};
    rlim_t soft{RLIM_INFINITY};
    rlim_t hard{RLIM_INFINITY};
};

/**
 * @brief Options for a supervised spawn
 */
struct SpawnOptions {
    std::vector<std::string> argv;
    std::optional<std::vector<std::string>> env;  ///< KEY=VALUE; nullopt inherits
    std::filesystem::path workingDirectory;       ///< Empty inherits
    std::string stdinData;
    std::vector<ChildLimit> limits;
    std::chrono::milliseconds timeout{std::chrono::seconds{30}};  ///< Zero disables
    std::size_t maxOutputBytes{1024 * 1024};  ///< Per stream
};

/**
 * @brief What a supervised child produced
 */
struct ProcessOutput {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{-1};      ///< 128 + signal when killed by a signal
    int termSignal{0};
    bool timedOut{false};
    bool cancelled{false};
    bool truncated{false};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto success() const noexcept -> bool {
        return exitCode == 0 && termSignal == 0 && !timedOut && !cancelled;
    }
};

/**
 * @brief Run a child to completion under supervision
 *
 * Returns an error only when the child could not be started; a child that
 * ran, failed, timed out or was cancelled is reported through ProcessOutput.
 */
[[nodiscard]] auto runProcess(const SpawnOptions& options,
                              std::stop_token stopToken = {})
    -> Result<ProcessOutput>;

/**
 * @brief Locate an executable by name on PATH, or check an explicit path
 */
[[nodiscard]] auto findExecutable(std::string_view name)
    -> std::optional<std::filesystem::path>;

}  // namespace jailchain::sandbox::process

#endif  // JAILCHAIN_SANDBOX_PROCESS_SUBPROCESS_HPP
