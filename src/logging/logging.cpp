/*
 * logging.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging.hpp"

#include <filesystem>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace jailchain::logging {

auto LoggingConfig::toJson() const -> nlohmann::json {
    return {{"level", levelToString(level)},
            {"pattern", pattern},
            {"enable_console", enable_console},
            {"console_color", console_color},
            {"enable_file", enable_file},
            {"log_dir", log_dir},
            {"log_filename", log_filename},
            {"max_file_size", max_file_size},
            {"max_files", max_files}};
}

auto LoggingConfig::fromJson(const nlohmann::json& j) -> LoggingConfig {
    LoggingConfig config;
    if (!j.is_object()) {
        return config;
    }
    config.level = levelFromString(j.value("level", "info"));
    config.pattern = j.value("pattern", config.pattern);
    config.enable_console = j.value("enable_console", config.enable_console);
    config.console_color = j.value("console_color", config.console_color);
    config.enable_file = j.value("enable_file", config.enable_file);
    config.log_dir = j.value("log_dir", config.log_dir);
    config.log_filename = j.value("log_filename", config.log_filename);
    config.max_file_size = j.value("max_file_size", config.max_file_size);
    config.max_files = j.value("max_files", config.max_files);
    return config;
}

auto levelFromString(const std::string& level) -> spdlog::level::level_enum {
    if (level == "trace")
        return spdlog::level::trace;
    if (level == "debug")
        return spdlog::level::debug;
    if (level == "info")
        return spdlog::level::info;
    if (level == "warn" || level == "warning")
        return spdlog::level::warn;
    if (level == "error" || level == "err")
        return spdlog::level::err;
    if (level == "critical" || level == "fatal")
        return spdlog::level::critical;
    if (level == "off")
        return spdlog::level::off;
    return spdlog::level::info;  // Default
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

auto createSinks(const LoggingConfig& config)
    -> std::vector<spdlog::sink_ptr> {
    std::vector<spdlog::sink_ptr> sinks;

    // stdout belongs to executed program output
    if (config.enable_console) {
        spdlog::sink_ptr sink;
        if (config.console_color) {
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        }
        sink->set_level(config.level);
        sink->set_pattern(config.pattern);
        sinks.push_back(sink);
    }

    if (config.enable_file) {
        try {
            std::filesystem::create_directories(config.log_dir);
            auto path = (std::filesystem::path(config.log_dir) /
                         (config.log_filename + ".log"))
                            .string();
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path, config.max_file_size, config.max_files);
            sink->set_level(spdlog::level::trace);
            sink->set_pattern(config.pattern);
            sinks.push_back(sink);
        } catch (const std::exception& e) {
            spdlog::error("Failed to create file sink in '{}': {}",
                          config.log_dir, e.what());
        }
    }

    return sinks;
}

void init(const LoggingConfig& config) {
    auto sinks = createSinks(config);
    auto logger = std::make_shared<spdlog::logger>("jailchain", sinks.begin(),
                                                   sinks.end());
    logger->set_level(config.enable_file ? spdlog::level::trace
                                         : config.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

}  // namespace jailchain::logging
