// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight enums used throughout the relay
// (clock primitives, timestamps carried on the wire, distance models).

#pragma once

#include <chrono>
#include <cstdint>

namespace maritime_relay {

/**
 * @brief Alias for the steady clock used for loop pacing.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for the wall clock used for position reports and liveness.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Absolute timestamp with millisecond resolution (milliseconds since the Unix epoch on the wire).
 */
using Timestamp = std::chrono::time_point<WallClock, std::chrono::milliseconds>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Capture the current wall-clock time truncated to milliseconds.
 */
inline Timestamp now_timestamp() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(WallClock::now());
}

/**
 * @brief Build a timestamp from milliseconds since the Unix epoch.
 */
constexpr Timestamp timestamp_from_millis(std::int64_t epoch_millis) {
    return Timestamp{std::chrono::milliseconds{epoch_millis}};
}

/**
 * @brief Milliseconds since the Unix epoch for @p timestamp.
 */
constexpr std::int64_t to_epoch_millis(Timestamp timestamp) {
    return timestamp.time_since_epoch().count();
}

/**
 * @brief Selects the distance model used between two positions.
 */
enum class CoordinateSystem {
    Cartesian, /**< Rhumb-line distance under a Mercator-like projection. */
    Geodesic   /**< Great-circle distance on a spherical earth. */
};

}  // namespace maritime_relay
