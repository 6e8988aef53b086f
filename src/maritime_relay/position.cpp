#include "maritime_relay/position.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include <fmt/format.h>

#include "maritime_relay/coordinate_converter.hpp"
#include "maritime_relay/errors.hpp"

namespace maritime_relay {

namespace {

constexpr double k_rhumb_epsilon{1e-12}; /**< Below this projected-latitude delta the path is treated as east-west. */

/**
 * @brief Convert degrees to radians.
 */
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}

/**
 * @brief Convert radians to degrees.
 */
constexpr double radians_to_degrees(double radians) {
    return radians * 180.0 / std::numbers::pi;
}

double normalize_bearing(double bearing_deg) {
    return std::fmod(bearing_deg + 360.0, 360.0);
}

/**
 * @brief Longitude delta in radians along the shorter way round the globe.
 */
double shortest_longitude_delta(double from_longitude_deg, double to_longitude_deg) {
    double delta_lon = degrees_to_radians(to_longitude_deg - from_longitude_deg);
    if (std::abs(delta_lon) > std::numbers::pi) {
        delta_lon = delta_lon > 0.0 ? -(2.0 * std::numbers::pi - delta_lon) : (2.0 * std::numbers::pi + delta_lon);
    }
    return delta_lon;
}

/**
 * @brief Difference in Mercator-projected latitude between two latitudes in radians.
 */
double projected_latitude_delta(double lat1_rad, double lat2_rad) {
    constexpr double k_polar_limit_rad{std::numbers::pi / 2.0 - 1e-12};
    lat1_rad = std::clamp(lat1_rad, -k_polar_limit_rad, k_polar_limit_rad);
    lat2_rad = std::clamp(lat2_rad, -k_polar_limit_rad, k_polar_limit_rad);
    return std::log(std::tan(std::numbers::pi / 4.0 + lat2_rad / 2.0) / std::tan(std::numbers::pi / 4.0 + lat1_rad / 2.0));
}

double linear_interpolation(double y1, std::int64_t x1, double y2, std::int64_t x2, std::int64_t x) {
    return y1 + (y2 - y1) / static_cast<double>(x2 - x1) * static_cast<double>(x - x1);
}

}  // namespace

Position::Position(double latitude_deg, double longitude_deg)
    : latitude_deg_(latitude_deg),
      longitude_deg_(longitude_deg) {
    if (!is_valid_latitude(latitude_deg)) {
        throw std::invalid_argument(fmt::format("Latitude must be within [-90, 90], got {}", latitude_deg));
    }
    if (!is_valid_longitude(longitude_deg)) {
        throw std::invalid_argument(fmt::format("Longitude must be within [-180, 180], got {}", longitude_deg));
    }
}

bool Position::is_valid_latitude(double latitude_deg) noexcept {
    return latitude_deg >= -90.0 && latitude_deg <= 90.0;
}

bool Position::is_valid_longitude(double longitude_deg) noexcept {
    return longitude_deg >= -180.0 && longitude_deg <= 180.0;
}

double Position::distance_to(const Position& other, CoordinateSystem system) const {
    return system == CoordinateSystem::Cartesian ? rhumb_line_distance_to(other) : geodesic_distance_to(other);
}

/**
 * @brief Determine the great-circle distance separating two coordinates.
 */
double Position::geodesic_distance_to(const Position& other) const {
    const double lat1 = degrees_to_radians(latitude_deg_);
    const double lat2 = degrees_to_radians(other.latitude_deg_);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(other.longitude_deg_ - longitude_deg_);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

/**
 * @brief Distance along the loxodrome joining two coordinates.
 */
double Position::rhumb_line_distance_to(const Position& other) const {
    const double lat1 = degrees_to_radians(latitude_deg_);
    const double lat2 = degrees_to_radians(other.latitude_deg_);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = shortest_longitude_delta(longitude_deg_, other.longitude_deg_);

    const double delta_projected = projected_latitude_delta(lat1, lat2);
    // East-west lines have no projected latitude delta; fall back to the parallel's scale.
    const double q = std::abs(delta_projected) > k_rhumb_epsilon ? delta_lat / delta_projected : std::cos(lat1);

    return std::sqrt(delta_lat * delta_lat + q * q * delta_lon * delta_lon) * k_earth_radius_m;
}

/**
 * @brief Compute the initial great-circle bearing from one coordinate to another.
 */
double Position::geodesic_bearing_to(const Position& other) const {
    const double lat1 = degrees_to_radians(latitude_deg_);
    const double lat2 = degrees_to_radians(other.latitude_deg_);
    const double delta_lon = degrees_to_radians(other.longitude_deg_ - longitude_deg_);

    const double y = std::sin(delta_lon) * std::cos(lat2);
    const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(delta_lon);
    return normalize_bearing(radians_to_degrees(std::atan2(y, x)));
}

double Position::rhumb_line_bearing_to(const Position& other) const {
    const double lat1 = degrees_to_radians(latitude_deg_);
    const double lat2 = degrees_to_radians(other.latitude_deg_);
    const double delta_lon = shortest_longitude_delta(longitude_deg_, other.longitude_deg_);
    const double delta_projected = projected_latitude_delta(lat1, lat2);
    return normalize_bearing(radians_to_degrees(std::atan2(delta_lon, delta_projected)));
}

std::string Position::to_string() const {
    return fmt::format("({}, {})", latitude_deg_, longitude_deg_);
}

void Position::write(MessageWriter& writer) const {
    writer.write_double(1, "latitude", latitude_deg_);
    writer.write_double(2, "longitude", longitude_deg_);
}

Position Position::read(MessageReader& reader) {
    const double latitude_deg = reader.read_double(1, "latitude");
    const double longitude_deg = reader.read_double(2, "longitude");
    if (!is_valid_latitude(latitude_deg) || !is_valid_longitude(longitude_deg)) {
        throw DecodeError(fmt::format("Encoded position out of range: ({}, {})", latitude_deg, longitude_deg));
    }
    return Position{latitude_deg, longitude_deg};
}

PositionTime::PositionTime(Position position, Timestamp time)
    : position_(position),
      time_(time) {}

PositionTime::PositionTime(double latitude_deg, double longitude_deg, Timestamp time)
    : position_(latitude_deg, longitude_deg),
      time_(time) {}

PositionTime PositionTime::create(const Position& position, Timestamp time) {
    return PositionTime{position, time};
}

double PositionTime::geodesic_distance_to(const Position& other) const {
    return position_.geodesic_distance_to(other);
}

PositionTime PositionTime::extrapolate_position(double course_deg, double speed_knots, Timestamp target_time) const {
    if (target_time < time_) {
        throw std::invalid_argument(fmt::format("Extrapolation time {} precedes the fix at {}",
                                                to_epoch_millis(target_time),
                                                to_epoch_millis(time_)));
    }

    const CoordinateConverter converter{position_};
    const PlanarPoint origin = converter.to_planar(position_);
    const auto elapsed_seconds = std::chrono::duration_cast<std::chrono::seconds>(target_time - time_).count();
    const double distance_m = static_cast<double>(elapsed_seconds) * speed_knots * k_knots_to_mps;
    const double angle_rad = degrees_to_radians(compass_to_cartesian(course_deg));

    const PlanarPoint destination{
        origin.x_m + std::cos(angle_rad) * distance_m,
        origin.y_m + std::sin(angle_rad) * distance_m
    };
    return PositionTime{converter.to_position(destination), target_time};
}

PositionTime PositionTime::interpolated_position(const PositionTime& later_position, Timestamp time) const {
    if (later_position.time_ < time_) {
        throw std::invalid_argument(fmt::format("Earlier fix at {} is later than the second fix at {}",
                                                to_epoch_millis(time_),
                                                to_epoch_millis(later_position.time_)));
    }
    if (time < time_) {
        throw std::invalid_argument(fmt::format("Interpolation time {} precedes the earlier fix at {}",
                                                to_epoch_millis(time),
                                                to_epoch_millis(time_)));
    }
    if (time > later_position.time_) {
        throw std::invalid_argument(fmt::format("Interpolation time {} follows the later fix at {}",
                                                to_epoch_millis(time),
                                                to_epoch_millis(later_position.time_)));
    }
    if (later_position.time_ == time_) {
        return PositionTime{position_, time};
    }

    const std::int64_t x1 = to_epoch_millis(time_);
    const std::int64_t x2 = to_epoch_millis(later_position.time_);
    const std::int64_t x = to_epoch_millis(time);
    return PositionTime{
        linear_interpolation(latitude(), x1, later_position.latitude(), x2, x),
        linear_interpolation(longitude(), x1, later_position.longitude(), x2, x),
        time
    };
}

bool PositionTime::position_equals(const Position& other) const noexcept {
    return position_ == other;
}

std::string PositionTime::to_string() const {
    return fmt::format("({}, {}, time={})", latitude(), longitude(), to_epoch_millis(time_));
}

void PositionTime::write(MessageWriter& writer) const {
    position_.write(writer);
    writer.write_int64(3, "time", to_epoch_millis(time_));
}

PositionTime PositionTime::read(MessageReader& reader) {
    const Position position = Position::read(reader);
    const std::int64_t epoch_millis = reader.read_int64(3, "time", 0);
    return PositionTime{position, timestamp_from_millis(epoch_millis)};
}

PositionTime interpolated_position(const PositionTime& earlier, const PositionTime& later, Timestamp time) {
    return earlier.interpolated_position(later, time);
}

}  // namespace maritime_relay
