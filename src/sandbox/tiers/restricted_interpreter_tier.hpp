/*
 * restricted_interpreter_tier.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file restricted_interpreter_tier.hpp
 * @brief In-process Python execution against a builtin allow-list
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_SANDBOX_TIERS_RESTRICTED_INTERPRETER_TIER_HPP
#define JAILCHAIN_SANDBOX_TIERS_RESTRICTED_INTERPRETER_TIER_HPP

#include "config/sandbox_config.hpp"
#include "sandbox/tier_executor.hpp"

#include <mutex>

namespace jailchain::sandbox {

/**
 * @brief Executes Python code in the embedded interpreter
 *
 * Code sees only the configured builtins: no open, __import__, eval, exec
 * or compile. stdout and stderr are captured through a guard that always
 * restores the interpreter's streams. A trace hook enforces the deadline
 * and cancellation by raising TimeoutError inside the running code.
 *
 * This is the weakest tier: it shares the host process memory and cannot
 * be resource-limited. The hook only fires between Python bytecode events,
 * so a single long call into C (sum(range(10**12)), pow(7, 10**9), a huge
 * integer exponent) is not interrupted and may overrun the deadline until
 * it returns, holding the service's execution lock meanwhile. Requires an
 * interpreter initialized by the host process (py::scoped_interpreter).
 */
class RestrictedInterpreterTier : public TierExecutor {
public:
    explicit RestrictedInterpreterTier(config::RestrictedTierConfig config);

    [[nodiscard]] auto descriptor() const -> TierDescriptor override;
    [[nodiscard]] auto supports(Language language) const -> bool override;
    [[nodiscard]] auto probe() noexcept -> bool override;
    [[nodiscard]] auto probeDetail() const -> std::string override;
    [[nodiscard]] auto execute(const ExecutionRequest& request,
                               std::stop_token stopToken)
        -> TierResult override;

private:
    config::RestrictedTierConfig config_;
    std::mutex executeMutex_;
};

}  // namespace jailchain::sandbox

#endif  // JAILCHAIN_SANDBOX_TIERS_RESTRICTED_INTERPRETER_TIER_HPP
