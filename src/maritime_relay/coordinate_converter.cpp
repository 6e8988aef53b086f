#include "maritime_relay/coordinate_converter.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace maritime_relay {

namespace {
constexpr double k_metres_per_degree{k_earth_radius_m * std::numbers::pi / 180.0};
constexpr double k_min_parallel_scale{1e-9}; /**< Keeps the east-west scale finite at the poles. */
}  // namespace

CoordinateConverter::CoordinateConverter(const Position& anchor)
    : anchor_latitude_deg_(anchor.latitude()),
      anchor_longitude_deg_(anchor.longitude()),
      metres_per_degree_longitude_(
          k_metres_per_degree * std::max(std::cos(anchor.latitude() * std::numbers::pi / 180.0), k_min_parallel_scale)
      ) {}

PlanarPoint CoordinateConverter::to_planar(const Position& position) const noexcept {
    return PlanarPoint{
        (position.longitude() - anchor_longitude_deg_) * metres_per_degree_longitude_,
        (position.latitude() - anchor_latitude_deg_) * k_metres_per_degree
    };
}

Position CoordinateConverter::to_position(const PlanarPoint& point) const {
    const double latitude_deg = std::clamp(anchor_latitude_deg_ + point.y_m / k_metres_per_degree, -90.0, 90.0);
    double longitude_deg = anchor_longitude_deg_ + point.x_m / metres_per_degree_longitude_;
    if (!Position::is_valid_longitude(longitude_deg)) {
        longitude_deg = std::fmod(longitude_deg + 180.0, 360.0);
        if (longitude_deg < 0.0) {
            longitude_deg += 360.0;
        }
        longitude_deg -= 180.0;
    }
    return Position{latitude_deg, longitude_deg};
}

double compass_to_cartesian(double course_deg) noexcept {
    double angle_deg = 90.0 - course_deg;
    angle_deg = std::fmod(angle_deg, 360.0);
    if (angle_deg < 0.0) {
        angle_deg += 360.0;
    }
    return angle_deg;
}

}  // namespace maritime_relay
