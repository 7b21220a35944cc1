#pragma once

/**
 * @file status.hpp
 * @brief Result codes returned by pool operations
 */

#include <ostream>

namespace workerpool {

/**
 * @brief Outcome of a pool operation
 *
 * Pool-level errors are returned synchronously from the call that
 * detected them. Nothing is retried on the caller's behalf.
 */
enum class Status {
    Ok,
    InvalidTask,    // Empty task submitted
    Closed,         // Pool has been closed
    Overload        // Live workers exceed capacity (internal to the pool)
};

[[nodiscard]] constexpr const char* to_string(Status status) noexcept {
    switch (status) {
        case Status::Ok:          return "ok";
        case Status::InvalidTask: return "invalid task, must be not empty";
        case Status::Closed:      return "pool has closed";
        case Status::Overload:    return "pool overload";
    }
    return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, Status status) {
    return os << to_string(status);
}

} // namespace workerpool
