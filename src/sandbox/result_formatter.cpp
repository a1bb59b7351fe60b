/*
 * result_formatter.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "result_formatter.hpp"

#include <algorithm>

#include <spdlog/fmt/fmt.h>

namespace jailchain::sandbox {

namespace {
constexpr const char* kFailureBanner = "⚠️ Sandbox execution failed";
constexpr const char* kCancelBanner = "⚠️ Sandbox execution cancelled";
constexpr const char* kNoOutput = "Code executed successfully (no output)";
}  // namespace

auto ResultFormatter::exhaustionKind(const std::vector<TierAttempt>& attempts)
    -> ErrorKind {
    bool allUnavailable = std::all_of(
        attempts.begin(), attempts.end(), [](const TierAttempt& attempt) {
            return attempt.kind == ErrorKind::Unavailable;
        });
    return allUnavailable ? ErrorKind::Unavailable : ErrorKind::RuntimeError;
}

auto ResultFormatter::formatExecution(const TierDescriptor& tier,
                                      const RawExecution& raw) -> std::string {
    std::string text = tier.heading() + ":\n";

    switch (raw.kind) {
        case ErrorKind::Timeout:
        case ErrorKind::ResourceLimit:
        case ErrorKind::Cancelled: {
            text += raw.detail.empty() ? errorKindToString(raw.kind)
                                       : raw.detail;
            // Partial output is still useful after a limit hit.
            if (!raw.stdoutText.empty()) {
                text += "\n\nPartial output:\n" + raw.stdoutText;
            }
            if (!raw.stderrText.empty()) {
                text += "\nSTDERR:\n" + raw.stderrText;
            }
            return text;
        }
        default:
            break;
    }

    if (raw.stdoutText.empty() && raw.stderrText.empty() && raw.exitCode == 0) {
        return text + kNoOutput;
    }

    text += raw.stdoutText;
    if (!raw.stderrText.empty()) {
        text += "\nSTDERR:\n" + raw.stderrText;
    }
    if (raw.exitCode != 0) {
        text += fmt::format("\nExit code: {}", raw.exitCode);
    }
    return text;
}

auto ResultFormatter::formatExhausted(const std::vector<TierAttempt>& attempts)
    -> std::string {
    std::string text = kFailureBanner;
    if (attempts.empty()) {
        return text + ": no isolation tier is configured";
    }

    text += ": no isolation tier could run this code.\nTiers attempted:";
    for (const auto& attempt : attempts) {
        text += fmt::format("\n  - {} ({}): {}",
                            describeTier(attempt.tier).heading(),
                            errorKindToString(attempt.kind), attempt.detail);
    }
    return text;
}

auto ResultFormatter::formatRaw(const RawExecution& raw) -> std::string {
    return fmt::format(
        "--- Raw output ---\nexit code: {}\nsignal: {}\nelapsed: {} ms\n"
        "stdout:\n{}\nstderr:\n{}",
        raw.exitCode, raw.signal, raw.elapsed.count(), raw.stdoutText,
        raw.stderrText);
}

auto ResultFormatter::format(const ChainOutcome& chain) const
    -> ExecutionOutcome {
    ExecutionOutcome outcome;
    outcome.attempts = chain.attempts;

    if (chain.cancelled) {
        outcome.errorKind = ErrorKind::Cancelled;
        outcome.text = kCancelBanner;
        return outcome;
    }

    if (!chain.raw || !chain.tier) {
        outcome.errorKind = exhaustionKind(chain.attempts);
        outcome.text = formatExhausted(chain.attempts);
        return outcome;
    }

    const auto& raw = *chain.raw;
    outcome.tierUsed = chain.tier;
    outcome.errorKind = raw.kind;
    outcome.exitCode = raw.exitCode;
    outcome.elapsed = raw.elapsed;
    outcome.text = formatExecution(*chain.tier, raw);

    if (policy_.showRawOutput) {
        outcome.text += "\n\n" + formatRaw(raw);
    }
    return outcome;
}

}  // namespace jailchain::sandbox
