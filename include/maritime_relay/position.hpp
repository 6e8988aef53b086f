// === Position ================================================================
//
// Immutable geographic positions, with and without a timestamp. Provides the
// two supported distance models (great-circle and rhumb-line), bearings, and
// the kinematic helpers used on position reports: dead reckoning and linear
// interpolation between two timed fixes.

#pragma once

#include <string>

#include "maritime_relay/message_codec.hpp"
#include "maritime_relay/types.hpp"

namespace maritime_relay {

inline constexpr double k_earth_radius_m{6'371'000.0};  /**< Mean Earth radius of the spherical model. */
inline constexpr double k_knots_to_mps{0.5144};         /**< Metres per second in one knot. */

/**
 * @brief Latitude/longitude pair in decimal degrees.
 *
 * Construction validates latitude in [-90, 90] and longitude in [-180, 180]
 * and throws std::invalid_argument otherwise, so every instance is in range.
 */
class Position {
  public:
    Position(double latitude_deg, double longitude_deg);

    [[nodiscard]] double latitude() const noexcept { return latitude_deg_; }
    [[nodiscard]] double longitude() const noexcept { return longitude_deg_; }

    /** @brief Distance in metres using the model selected by @p system. */
    [[nodiscard]] double distance_to(const Position& other, CoordinateSystem system) const;
    /** @brief Great-circle (haversine) distance in metres. */
    [[nodiscard]] double geodesic_distance_to(const Position& other) const;
    /** @brief Constant-bearing distance in metres. */
    [[nodiscard]] double rhumb_line_distance_to(const Position& other) const;

    /** @brief Initial great-circle bearing toward @p other in degrees [0, 360). */
    [[nodiscard]] double geodesic_bearing_to(const Position& other) const;
    /** @brief Constant rhumb-line bearing toward @p other in degrees [0, 360). */
    [[nodiscard]] double rhumb_line_bearing_to(const Position& other) const;

    [[nodiscard]] std::string to_string() const;

    void write(MessageWriter& writer) const;
    static Position read(MessageReader& reader);

    [[nodiscard]] static bool is_valid_latitude(double latitude_deg) noexcept;
    [[nodiscard]] static bool is_valid_longitude(double longitude_deg) noexcept;

    friend bool operator==(const Position&, const Position&) = default;

  private:
    double latitude_deg_;
    double longitude_deg_;
};

/**
 * @brief A position fix stamped with the absolute time it was observed.
 */
class PositionTime final {
  public:
    PositionTime(Position position, Timestamp time);
    PositionTime(double latitude_deg, double longitude_deg, Timestamp time);

    [[nodiscard]] static PositionTime create(const Position& position, Timestamp time);

    [[nodiscard]] const Position& position() const noexcept { return position_; }
    [[nodiscard]] double latitude() const noexcept { return position_.latitude(); }
    [[nodiscard]] double longitude() const noexcept { return position_.longitude(); }
    [[nodiscard]] Timestamp time() const noexcept { return time_; }

    [[nodiscard]] double geodesic_distance_to(const Position& other) const;

    /**
     * @brief Dead-reckon the position reached at @p target_time.
     *
     * Sails @p course_deg (compass degrees) at @p speed_knots for the whole
     * seconds elapsed since this fix, on a local planar frame anchored here.
     * Throws std::invalid_argument when @p target_time precedes this fix.
     */
    [[nodiscard]] PositionTime extrapolate_position(double course_deg, double speed_knots, Timestamp target_time) const;

    /**
     * @brief Linearly interpolate toward @p later_position at @p time.
     *
     * Requires this fix <= @p time <= @p later_position in time; throws
     * std::invalid_argument otherwise. Inputs are never reordered.
     */
    [[nodiscard]] PositionTime interpolated_position(const PositionTime& later_position, Timestamp time) const;

    /** @brief Compare only the coordinates, ignoring the timestamps. */
    [[nodiscard]] bool position_equals(const Position& other) const noexcept;

    [[nodiscard]] std::string to_string() const;

    void write(MessageWriter& writer) const;
    static PositionTime read(MessageReader& reader);

    friend bool operator==(const PositionTime&, const PositionTime&) = default;

  private:
    Position position_;
    Timestamp time_;
};

/** @brief Free-function form of PositionTime::interpolated_position. */
PositionTime interpolated_position(const PositionTime& earlier, const PositionTime& later, Timestamp time);

}  // namespace maritime_relay
