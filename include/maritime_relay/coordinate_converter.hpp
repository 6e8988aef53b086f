// === Coordinate Converter ====================================================
//
// Local planar projection anchored at a reference position. x grows east and
// y grows north, both in metres; accurate for distances that are small
// relative to the Earth's radius.

#pragma once

#include "maritime_relay/position.hpp"

namespace maritime_relay {

/** @brief Planar point in metres relative to the converter's anchor. */
struct PlanarPoint final {
    double x_m{};  /**< Eastward offset in metres. */
    double y_m{};  /**< Northward offset in metres. */
};

class CoordinateConverter final {
  public:
    explicit CoordinateConverter(const Position& anchor);

    [[nodiscard]] PlanarPoint to_planar(const Position& position) const noexcept;
    /** @brief Inverse projection; latitude is clamped to the poles and longitude wrapped to [-180, 180]. */
    [[nodiscard]] Position to_position(const PlanarPoint& point) const;

  private:
    double anchor_latitude_deg_;
    double anchor_longitude_deg_;
    double metres_per_degree_longitude_;
};

/** @brief Convert a compass course (0 = north, clockwise) to a planar angle in degrees (0 = east, counter-clockwise). */
double compass_to_cartesian(double course_deg) noexcept;

}  // namespace maritime_relay
