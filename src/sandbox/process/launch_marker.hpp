/*
 * launch_marker.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file launch_marker.hpp
 * @brief Tells a wrapper's own startup failures apart from program errors
 *
 * Jail wrappers (firejail, unshare, chroot) and the program they start
 * share stdout, stderr and the exit status. The marker is a random token
 * printed to stderr by a /bin/sh shim immediately before it execs the
 * program: if the token is present the jail came up, whatever the
 * program printed afterwards.
 */

#ifndef JAILCHAIN_SANDBOX_PROCESS_LAUNCH_MARKER_HPP
#define JAILCHAIN_SANDBOX_PROCESS_LAUNCH_MARKER_HPP

#include "subprocess.hpp"

#include <string>
#include <vector>

namespace jailchain::sandbox::process {

class LaunchMarker {
public:
    /**
     * @brief A marker with a fresh random token
     */
    [[nodiscard]] static auto generate() -> LaunchMarker;

    explicit LaunchMarker(std::string token);

    [[nodiscard]] auto token() const noexcept -> const std::string& {
        return token_;
    }

    /**
     * @brief Prefix a command with the shim that announces the launch
     * @param command Program and arguments to exec once inside the jail
     * @param shell Shell path as seen inside the jail
     */
    [[nodiscard]] auto wrap(const std::vector<std::string>& command,
                            const std::string& shell = "/bin/sh") const
        -> std::vector<std::string>;

    /**
     * @brief True when the shim ran, i.e. the wrapper reached the program
     */
    [[nodiscard]] auto reached(const ProcessOutput& output) const -> bool;

    /**
     * @brief Remove the marker line from captured stderr
     */
    void strip(ProcessOutput& output) const;

private:
    std::string token_;
};

}  // namespace jailchain::sandbox::process

#endif  // JAILCHAIN_SANDBOX_PROCESS_LAUNCH_MARKER_HPP
