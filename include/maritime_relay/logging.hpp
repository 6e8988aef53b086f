#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

namespace maritime_relay {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/**
 * @brief Log @p event as one serialized JSON object.
 *
 * Every line reaching the file sink goes through here so that peer-supplied
 * strings are escaped and the JSON-lines file stays parseable.
 */
void log_event(spdlog::logger& logger, spdlog::level::level_enum level, const nlohmann::json& event);

}  // namespace maritime_relay
