#include "maritime_relay/relay_runtime.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>
#include <string>
#include <thread>

#include "maritime_relay/logging.hpp"
#include "maritime_relay/secure_random.hpp"

namespace maritime_relay {

namespace {

const Position k_harbour_center{55.6920, 12.6010};   /**< Centre of the simulated operating area. */
constexpr char k_vessel_endpoint[] = "ais";         /**< Endpoint every simulated vessel advertises. */
constexpr double k_min_speed_knots{2.0};
constexpr double k_max_speed_knots{18.0};
constexpr std::int32_t k_locate_radius_m{5'000};
constexpr std::int32_t k_locate_max_results{5};

/** @brief Logs the lifecycle of one vessel's connection. */
class SessionLogListener final : public ConnectionListener {
  public:
    explicit SessionLogListener(Id160 target_id) : target_id_(target_id), logger_(get_logger()) {}

    void connected(const std::string& endpoint_uri, bool resumed_session) override {
        log_event(*logger_, spdlog::level::info,
                  {{"component", "session"},
                   {"event", "connected"},
                   {"target", target_id_.to_string()},
                   {"uri", endpoint_uri},
                   {"resumed", resumed_session}});
    }

    void disconnected(CloseCode close_code) override {
        log_event(*logger_, spdlog::level::info,
                  {{"component", "session"},
                   {"event", "disconnected"},
                   {"target", target_id_.to_string()},
                   {"code", to_string(close_code)}});
    }

  private:
    const Id160 target_id_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace

RelayRuntime::RelayRuntime(RelayConfig configuration)
    : configuration_(std::move(configuration)),
      registry_(configuration_.registry_shard_count),
      endpoint_service_(registry_),
      operating_area_(Circle{k_harbour_center, configuration_.simulation.region_radius_m}),
      logger_(get_logger()) {}

RelayRuntime::~RelayRuntime() {
    shutdown();
}

void RelayRuntime::initialize() {
    log_event(*logger_, spdlog::level::info,
              {{"component", "runtime"}, {"event", "initializing"}, {"vessels", configuration_.simulation.vessel_count}});
    SecureRandom& random = SecureRandom::current();
    const Timestamp now = now_timestamp();

    list_vessels_.reserve(configuration_.simulation.vessel_count);
    for (std::size_t index = 0; index < configuration_.simulation.vessel_count; ++index) {
        const Id160 vessel_id = random.next_id160();
        auto listeners = ConnectionListenerList{std::make_shared<SessionLogListener>(vessel_id)};
        auto connection = std::make_unique<TargetConnection>(vessel_id, registry_, std::move(listeners));

        const std::string endpoint_uri = "sim://vessel-" + std::to_string(index + 1);
        connection->events().connecting(endpoint_uri);
        connection->events().connected(endpoint_uri, false);

        const PositionTime departure{operating_area_.random_position(random), now};
        registry_.update_position(vessel_id, departure);
        endpoint_service_.register_endpoint(vessel_id, k_vessel_endpoint);

        list_vessels_.push_back(SimulatedVessel{std::move(connection),
                                                departure,
                                                random.next_double(360.0),
                                                random.next_double(k_min_speed_knots, k_max_speed_knots)});
    }
}

void RelayRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    log_event(*logger_, spdlog::level::info, {{"component", "runtime"}, {"event", "starting"}});
    update_thread_ = std::thread(&RelayRuntime::update_loop, this);
}

void RelayRuntime::shutdown() {
    if (flag_running_.exchange(false)) {
        log_event(*logger_, spdlog::level::info, {{"component", "runtime"}, {"event", "shutting_down"}});
        if (update_thread_.joinable()) {
            update_thread_.join();
        }
    }
    for (SimulatedVessel& vessel : list_vessels_) {
        if (vessel.connection->is_connected()) {
            vessel.connection->events().disconnected(CloseCode::GoingAway);
        }
    }
}

void RelayRuntime::tick(Timestamp now) {
    std::size_t count_connected{0};
    for (SimulatedVessel& vessel : list_vessels_) {
        TargetConnection& connection = *vessel.connection;
        if (!connection.is_connected()) {
            continue;
        }
        const PositionTime fix = vessel.departure.extrapolate_position(vessel.course_deg, vessel.speed_knots, now);
        if (!operating_area_.contains(fix.position())) {
            connection.events().disconnected(CloseCode::GoingAway);
            continue;
        }
        registry_.update_position(connection.target_id(), fix);
        ++count_connected;
    }

    std::size_t count_located{0};
    if (!list_vessels_.empty()) {
        const TargetConnection& requester = *list_vessels_.front().connection;
        LocateRequest request{};
        request.endpoint_name = k_vessel_endpoint;
        request.radius_m = k_locate_radius_m;
        request.max_results = k_locate_max_results;
        if (const auto snapshot = registry_.find(requester.target_id()); snapshot && snapshot->position) {
            request.sender_position = snapshot->position->position();
        }
        count_located = endpoint_service_.locate(requester.target_id(), request).size();
    }

    const std::size_t count_swept = registry_.remove_inactive(now, configuration_.target_timeout);

    log_event(*logger_, spdlog::level::info,
              {{"component", "runtime"},
               {"event", "tick"},
               {"targets", registry_.size()},
               {"connected", count_connected},
               {"located", count_located},
               {"swept", count_swept}});
}

void RelayRuntime::update_loop() {
    const Duration tick_interval{1.0 / configuration_.sweep_hz};
    const SteadyClock::duration steady_tick_interval = std::chrono::duration_cast<SteadyClock::duration>(tick_interval);
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        const auto now = SteadyClock::now();
        if (now < next_tick) {
            std::this_thread::sleep_for(next_tick - now);
            continue;
        }
        try {
            tick(now_timestamp());
        } catch (const std::exception& exc) {
            log_event(*logger_, spdlog::level::err,
                      {{"component", "runtime"}, {"event", "update_failed"}, {"error", exc.what()}});
        }
        next_tick = now + steady_tick_interval;
    }
}

}  // namespace maritime_relay
