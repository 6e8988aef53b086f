// === Relay Runtime ===========================================================
//
// Demo host for the relay core. Wires the registry and endpoint service
// together, connects a fleet of simulated vessels, and drives a fixed-rate
// loop that dead-reckons the fleet, answers a locate on behalf of one vessel,
// and sweeps targets that have been gone for longer than the configured
// timeout.

#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "maritime_relay/area.hpp"
#include "maritime_relay/configuration.hpp"
#include "maritime_relay/endpoint_service.hpp"
#include "maritime_relay/position.hpp"
#include "maritime_relay/target_connection.hpp"
#include "maritime_relay/target_registry.hpp"

namespace maritime_relay {

/** @brief One simulated vessel: its connection plus a constant course and speed. */
struct SimulatedVessel final {
    std::unique_ptr<TargetConnection> connection;
    PositionTime departure;     /**< Fix the vessel dead-reckons from. */
    double course_deg{};
    double speed_knots{};
};

/** @brief Owns the relay core and the update thread driving the demo fleet. */
class RelayRuntime final {
  public:
    explicit RelayRuntime(RelayConfig configuration);
    ~RelayRuntime();

    RelayRuntime(const RelayRuntime&) = delete;
    RelayRuntime& operator=(const RelayRuntime&) = delete;

    /** @brief Connect the simulated fleet and advertise its endpoints. */
    void initialize();
    /** @brief Start the background update loop. */
    void run();
    /** @brief Stop the loop and disconnect the remaining vessels. */
    void shutdown();

    /** @brief Advance the fleet to @p now and perform one locate and sweep. */
    void tick(Timestamp now);

    [[nodiscard]] const TargetRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const Area& operating_area() const noexcept { return operating_area_; }

  private:
    void update_loop();

    RelayConfig configuration_;
    TargetRegistry registry_;
    EndpointService endpoint_service_;
    Area operating_area_;
    std::vector<SimulatedVessel> list_vessels_;
    std::atomic<bool> flag_running_{false};
    std::thread update_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace maritime_relay
