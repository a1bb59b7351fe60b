/*
 * result_formatter.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file result_formatter.hpp
 * @brief Turns chain outcomes into labelled, caller-facing results
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_RESULT_FORMATTER_HPP
#define JAILCHAIN_SANDBOX_RESULT_FORMATTER_HPP

#include "tier_chain.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace jailchain::sandbox {

/**
 * @brief Normalizes what a tier produced into an ExecutionOutcome
 *
 * The text always starts with the tier heading (`<icon> <label>:`), or
 * with a warning line when no tier could run the code.
 */
class ResultFormatter {
public:
    explicit ResultFormatter(const SandboxPolicy& policy) : policy_(policy) {}

    [[nodiscard]] auto format(const ChainOutcome& chain) const
        -> ExecutionOutcome;

    [[nodiscard]] static auto formatExecution(const TierDescriptor& tier,
                                              const RawExecution& raw)
        -> std::string;

    [[nodiscard]] static auto formatExhausted(
        const std::vector<TierAttempt>& attempts) -> std::string;

    [[nodiscard]] static auto formatRaw(const RawExecution& raw) -> std::string;

    /**
     * @brief Unavailable when every tier was unavailable, else RuntimeError
     */
    [[nodiscard]] static auto exhaustionKind(
        const std::vector<TierAttempt>& attempts) -> ErrorKind;

private:
    const SandboxPolicy& policy_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_RESULT_FORMATTER_HPP
