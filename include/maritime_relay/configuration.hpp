// === Configuration ===========================================================
//
// Strongly-typed settings for the relay and its demo runtime.
// `ConfigurationLoader` translates environment variables into these structures
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "maritime_relay/types.hpp"

namespace maritime_relay {

/** @brief Knobs for the simulated fleet driven by RelayRuntime. */
struct SimulationConfig final {
    std::size_t vessel_count{};  /**< Number of simulated vessels. */
    double region_radius_m{};    /**< Radius of the circular operating area. */
};

/**
 * @brief Immutable bundle of runtime knobs for the relay.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct RelayConfig final {
    std::string log_directory{};                /**< Destination directory for structured logs. */
    std::optional<std::string> log_level{};     /**< Requested log level name, if any. */
    std::size_t registry_shard_count{};         /**< Number of independently locked registry shards. */
    Duration target_timeout{};                  /**< Idle time after which disconnected targets are swept. */
    double sweep_hz{};                          /**< Runtime loop cadence in Hertz. */
    SimulationConfig simulation{};              /**< Demo fleet settings. */
};

/** @brief Hydrates RelayConfig from environment variables. */
class ConfigurationLoader final {
  public:
    static RelayConfig load();
};

}  // namespace maritime_relay
