#pragma once

/**
 * @file logging.hpp
 * @brief Library logger and logging macros
 */

#include <memory>

#include <spdlog/spdlog.h>

namespace workerpool {

/**
 * @brief Name under which the library logger is registered with spdlog
 */
constexpr const char* LOGGER_NAME = "workerpool";

/**
 * @brief Shared library logger
 *
 * Created on first use with a colored stderr sink at warn level. If a
 * logger named LOGGER_NAME is already registered with spdlog (e.g. the
 * application installed its own sinks), that one is used instead.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Change the library log level
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace workerpool

#define WORKERPOOL_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::workerpool::logger(), __VA_ARGS__)
#define WORKERPOOL_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::workerpool::logger(), __VA_ARGS__)
#define WORKERPOOL_LOG_INFO(...)  SPDLOG_LOGGER_INFO(::workerpool::logger(), __VA_ARGS__)
#define WORKERPOOL_LOG_WARN(...)  SPDLOG_LOGGER_WARN(::workerpool::logger(), __VA_ARGS__)
#define WORKERPOOL_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::workerpool::logger(), __VA_ARGS__)
