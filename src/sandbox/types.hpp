/*
 * types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file types.hpp
 * @brief Sandbox execution type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_TYPES_HPP
#define JAILCHAIN_SANDBOX_TYPES_HPP

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jailchain::sandbox {

using json = nlohmann::json;

/**
 * @brief Language of a code snippet
 */
enum class Language {
    Python,  ///< python / python3 / py
    Shell,   ///< shell / sh / bash
    Other    ///< Any other language, interpreter named by the request
};

/**
 * @brief Parse a language tag as written by the agent
 */
[[nodiscard]] auto parseLanguage(std::string_view tag) -> Language;

[[nodiscard]] constexpr std::string_view languageToString(
    Language language) noexcept {
    switch (language) {
        case Language::Python: return "python";
        case Language::Shell: return "shell";
        case Language::Other: return "other";
    }
    return "unknown";
}

/**
 * @brief Isolation tiers, strongest first
 */
enum class TierKind {
    Container,
    ProcessJail,
    NamespaceJail,
    RestrictedInterpreter,
    Local
};

[[nodiscard]] constexpr std::string_view tierKindToString(
    TierKind kind) noexcept {
    switch (kind) {
        case TierKind::Container: return "container";
        case TierKind::ProcessJail: return "process_jail";
        case TierKind::NamespaceJail: return "namespace_jail";
        case TierKind::RestrictedInterpreter: return "restricted_interpreter";
        case TierKind::Local: return "local";
    }
    return "unknown";
}

/**
 * @brief Parse a tier name ("container", "process_jail", ...)
 */
[[nodiscard]] auto tierKindFromString(std::string_view name)
    -> std::optional<TierKind>;

/**
 * @brief Observed default preference order
 */
[[nodiscard]] auto defaultTierOrder() -> std::vector<TierKind>;

/**
 * @brief Static identity of a tier
 */
struct TierDescriptor {
    TierKind kind{TierKind::Local};
    std::string name;
    std::string icon;
    std::string label;

    [[nodiscard]] auto heading() const -> std::string {
        return icon + " " + label;
    }

    [[nodiscard]] auto toJson() const -> json;

    bool operator==(const TierDescriptor&) const = default;
};

/**
 * @brief Builtin descriptor for a tier kind
 */
[[nodiscard]] auto describeTier(TierKind kind) -> TierDescriptor;

/**
 * @brief Error taxonomy of an execution outcome
 */
enum class ErrorKind {
    None,
    Unavailable,    ///< Isolation mechanism missing or failed to start
    Timeout,        ///< Wall clock or interpreter deadline exceeded
    ResourceLimit,  ///< CPU, memory, file size or process limit hit
    RuntimeError,   ///< Isolation mechanism failed while running
    Transient,      ///< Missing dependency; a retry may succeed
    Cancelled       ///< Caller requested cancellation
};

[[nodiscard]] constexpr std::string_view errorKindToString(
    ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::Unavailable: return "unavailable";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::ResourceLimit: return "resource_limit";
        case ErrorKind::RuntimeError: return "runtime_error";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Resource ceilings applied to one tier
 */
struct ResourceLimits {
    std::chrono::seconds maxWall{30};
    std::chrono::seconds maxCpu{10};
    std::size_t maxMemoryBytes{128ULL * 1024 * 1024};
    std::size_t maxFileSizeBytes{10ULL * 1024 * 1024};
    std::size_t maxProcesses{10};
    double cpuQuota{0.5};

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> ResourceLimits;
    [[nodiscard]] static auto fromJson(const json& j,
                                       const ResourceLimits& defaults)
        -> ResourceLimits;
};

/**
 * @brief One code execution request
 */
struct ExecutionRequest {
    std::string code;
    Language language{Language::Python};
    std::string languageName{"python"};  ///< Raw tag, used for Other

    [[nodiscard]] static auto make(std::string code, std::string_view tag)
        -> ExecutionRequest;

    /**
     * @brief File extension used when the code is written to disk
     */
    [[nodiscard]] auto fileExtension() const -> std::string;
};

/**
 * @brief A tier ran the code; what the process produced
 */
struct RawExecution {
    std::string stdoutText;
    std::string stderrText;
    int exitCode{0};
    int signal{0};
    ErrorKind kind{ErrorKind::None};  ///< None, Timeout, ResourceLimit, Cancelled
    std::string detail;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief The isolation mechanism itself failed; the chain falls through
 */
struct TierFailure {
    ErrorKind kind{ErrorKind::Unavailable};  ///< Unavailable or RuntimeError
    std::string detail;
};

using TierResult = std::expected<RawExecution, TierFailure>;

/**
 * @brief Record of one tier the chain considered
 */
struct TierAttempt {
    TierKind tier{TierKind::Local};
    ErrorKind kind{ErrorKind::None};
    std::string detail;

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Uniform result returned to the caller
 */
struct ExecutionOutcome {
    std::string text;
    std::optional<TierDescriptor> tierUsed;
    ErrorKind errorKind{ErrorKind::None};
    int exitCode{0};
    std::chrono::milliseconds elapsed{0};
    std::vector<TierAttempt> attempts;
    std::optional<std::string> installedPackage;
    bool retried{false};

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return errorKind == ErrorKind::None;
    }

    [[nodiscard]] auto toJson() const -> json;
};

/**
 * @brief Per-session execution policy
 */
struct SandboxPolicy {
    bool preferLocal{false};
    bool allowAutoInstalls{false};
    bool allowAutoExec{true};
    bool showRawOutput{false};
    std::vector<TierKind> excludedTiers;

    [[nodiscard]] auto excludes(TierKind kind) const -> bool;

    [[nodiscard]] auto toJson() const -> json;
    [[nodiscard]] static auto fromJson(const json& j) -> SandboxPolicy;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TYPES_HPP
