#pragma once

/**
 * @file workerpool.hpp
 * @brief Main header for workerpool - bounded pool of reusable workers
 *
 * Include this single header to access the full workerpool API.
 */

#include "workerpool/core/status.hpp"
#include "workerpool/core/task.hpp"
#include "workerpool/core/metrics.hpp"
#include "workerpool/core/logging.hpp"
#include "workerpool/core/pool.hpp"

namespace workerpool {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace workerpool
