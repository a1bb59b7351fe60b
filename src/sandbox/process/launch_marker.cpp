/*
 * launch_marker.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "launch_marker.hpp"

#include <cstdint>
#include <random>

#include <spdlog/fmt/fmt.h>

namespace jailchain::sandbox::process {

namespace {

// $0 carries the token so it never needs quoting
constexpr const char* kShimScript = "printf '%s\\n' \"$0\" >&2; exec \"$@\"";

}  // namespace

auto LaunchMarker::generate() -> LaunchMarker {
    std::random_device device;
    std::uniform_int_distribution<std::uint64_t> dist;
    std::mt19937_64 engine(
        (static_cast<std::uint64_t>(device()) << 32) | device());
    return LaunchMarker(
        fmt::format("jailchain-launch-{:016x}{:016x}", dist(engine),
                    dist(engine)));
}

LaunchMarker::LaunchMarker(std::string token) : token_(std::move(token)) {}

auto LaunchMarker::wrap(const std::vector<std::string>& command,
                        const std::string& shell) const
    -> std::vector<std::string> {
    std::vector<std::string> argv = {shell, "-c", kShimScript, token_};
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

auto LaunchMarker::reached(const ProcessOutput& output) const -> bool {
    return output.stderrText.find(token_) != std::string::npos;
}

void LaunchMarker::strip(ProcessOutput& output) const {
    auto pos = output.stderrText.find(token_);
    if (pos == std::string::npos) {
        return;
    }
    auto length = token_.size();
    if (pos + length < output.stderrText.size() &&
        output.stderrText[pos + length] == '\n') {
        ++length;
    }
    output.stderrText.erase(pos, length);
}

}  // namespace jailchain::sandbox::process
