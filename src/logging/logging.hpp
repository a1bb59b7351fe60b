/*
 * logging.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file logging.hpp
 * @brief Logger setup for jailchain
 * @date 2024
 * @version 1.0.0
 */

#ifndef JAILCHAIN_LOGGING_LOGGING_HPP
#define JAILCHAIN_LOGGING_LOGGING_HPP

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>
#include <vector>

namespace jailchain::logging {

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v"};

    // Console settings
    bool enable_console{true};
    bool console_color{true};

    // File settings
    bool enable_file{false};
    std::string log_dir{"logs"};
    std::string log_filename{"jailchain"};
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{5};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> LoggingConfig;
};

/**
 * @brief Convert level string to spdlog enum
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> spdlog::level::level_enum;

/**
 * @brief Convert spdlog level enum to string
 */
[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

/**
 * @brief Sinks described by a configuration
 */
[[nodiscard]] auto createSinks(const LoggingConfig& config)
    -> std::vector<spdlog::sink_ptr>;

/**
 * @brief Install the "jailchain" logger as spdlog's default logger
 */
void init(const LoggingConfig& config);

}  // namespace jailchain::logging

#endif  // JAILCHAIN_LOGGING_LOGGING_HPP
