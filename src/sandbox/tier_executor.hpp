/*
 * tier_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file tier_executor.hpp
 * @brief Interface implemented by every isolation tier
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_TIER_EXECUTOR_HPP
#define JAILCHAIN_SANDBOX_TIER_EXECUTOR_HPP

#include "types.hpp"

#include <stop_token>

namespace jailchain::sandbox {

/**
 * @brief One isolation mechanism in the fallback chain
 *
 * probe() reports whether the mechanism can be used right now and must
 * never throw. execute() runs one request end to end: it creates the
 * isolated context, runs the code, enforces limits, captures output and
 * tears the context down before returning. A RawExecution means the code
 * ran (even if it failed, timed out or hit a limit); a TierFailure means
 * the mechanism itself failed and the chain should fall through.
 */
class TierExecutor {
public:
    virtual ~TierExecutor() = default;

    [[nodiscard]] virtual auto descriptor() const -> TierDescriptor = 0;

    /**
     * @brief Cheap applicability check without side effects
     */
    [[nodiscard]] virtual auto supports(Language language) const -> bool = 0;

    [[nodiscard]] virtual auto probe() noexcept -> bool = 0;

    /**
     * @brief Short description of the last probe result
     */
    [[nodiscard]] virtual auto probeDetail() const -> std::string {
        return {};
    }

    [[nodiscard]] virtual auto execute(const ExecutionRequest& request,
                                       std::stop_token stopToken)
        -> TierResult = 0;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIER_EXECUTOR_HPP
