// === Configuration Loader ====================================================
//
// Parses and validates the environment-driven settings that feed the relay.
// Unset, unparsable or non-positive values fall back to their defaults with a
// warning. The logger is initialized here because its directory is itself a
// setting.

#include "maritime_relay/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "maritime_relay/logging.hpp"

namespace maritime_relay {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr int k_default_registry_shards{16};
constexpr double k_default_target_timeout_s{300.0};
constexpr double k_default_sweep_hz{1.0};
constexpr int k_default_sim_vessels{25};
constexpr double k_default_sim_region_radius_m{20'000.0};

double parse_double(const char* variable_name, double fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value > 0.0) {
            return parsed_value;
        }
    } catch (const std::exception&) {
        // Reported below with the non-positive case.
    }
    log_event(*get_logger(), spdlog::level::warn,
              {{"component", "configuration"},
               {"event", "invalid_value"},
               {"variable", variable_name},
               {"value", raw_value},
               {"fallback", fallback}});
    return fallback;
}

int parse_int(const char* variable_name, int fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value > 0) {
            return parsed_value;
        }
    } catch (const std::exception&) {
        // Reported below with the non-positive case.
    }
    log_event(*get_logger(), spdlog::level::warn,
              {{"component", "configuration"},
               {"event", "invalid_value"},
               {"variable", variable_name},
               {"value", raw_value},
               {"fallback", fallback}});
    return fallback;
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("MARITIME_RELAY_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

RelayConfig ConfigurationLoader::load() {
    RelayConfig config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    log_event(*logger, spdlog::level::info, {{"component", "configuration"}, {"event", "loading"}});

    if (const char* raw_level = std::getenv("MARITIME_RELAY_LOG_LEVEL"); raw_level != nullptr && *raw_level != '\0') {
        config.log_level = std::string{raw_level};
    }
    config.registry_shard_count = static_cast<std::size_t>(parse_int("MARITIME_RELAY_REGISTRY_SHARDS", k_default_registry_shards));
    config.target_timeout = Duration{parse_double("MARITIME_RELAY_TARGET_TIMEOUT_S", k_default_target_timeout_s)};
    config.sweep_hz = parse_double("MARITIME_RELAY_SWEEP_HZ", k_default_sweep_hz);
    config.simulation.vessel_count = static_cast<std::size_t>(parse_int("MARITIME_RELAY_SIM_VESSELS", k_default_sim_vessels));
    config.simulation.region_radius_m = parse_double("MARITIME_RELAY_SIM_REGION_RADIUS_M", k_default_sim_region_radius_m);

    log_event(*logger, spdlog::level::info,
              {{"component", "configuration"},
               {"event", "loaded"},
               {"registry_shards", config.registry_shard_count},
               {"target_timeout_s", config.target_timeout.count()},
               {"sweep_hz", config.sweep_hz},
               {"sim_vessels", config.simulation.vessel_count},
               {"sim_region_radius_m", config.simulation.region_radius_m}});

    return config;
}

}  // namespace maritime_relay
