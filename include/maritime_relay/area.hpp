// === Area ====================================================================
//
// Closed geographic shapes used for spatial filtering and carried on the wire.
// `Area` is a tagged union over the four supported variants (circle,
// rectangle, polygon, union of areas); every algorithm dispatches on the
// variant exactly once through `std::visit`.
//
// Wire layout: an area message carries exactly one of
//   1 "circle"  -> Circle   { 1 center: Position, 2 radius: double,
//                             3 coordinateSystem: int32 (0 Cartesian, 1 Geodesic; absent means Cartesian) }
//   2 "box"     -> Rectangle{ 1 topLeft: Position, 2 bottomRight: Position }
//   3 "polygon" -> Polygon  { 1 points: list<Position> }
//   4 "areas"   -> list<Area>  (a union; may be empty, may nest)
// Readers check the discriminants in that order; a message carrying none of
// them fails with DecodeError.

#pragma once

#include <string>
#include <variant>
#include <vector>

#include "maritime_relay/message_codec.hpp"
#include "maritime_relay/position.hpp"
#include "maritime_relay/secure_random.hpp"
#include "maritime_relay/types.hpp"

namespace maritime_relay {

/** @brief Axis-aligned latitude/longitude box. Derived from areas, never edited in place. */
class BoundingBox final {
  public:
    BoundingBox(double min_latitude_deg, double max_latitude_deg, double min_longitude_deg, double max_longitude_deg);

    [[nodiscard]] double min_latitude() const noexcept { return min_latitude_deg_; }
    [[nodiscard]] double max_latitude() const noexcept { return max_latitude_deg_; }
    [[nodiscard]] double min_longitude() const noexcept { return min_longitude_deg_; }
    [[nodiscard]] double max_longitude() const noexcept { return max_longitude_deg_; }
    [[nodiscard]] Position top_left() const;
    [[nodiscard]] Position bottom_right() const;

    [[nodiscard]] bool contains(const Position& position) const noexcept;
    [[nodiscard]] bool intersects(const BoundingBox& other) const noexcept;
    /** @brief Smallest box covering both this box and @p other. */
    [[nodiscard]] BoundingBox merged_with(const BoundingBox& other) const;

    friend bool operator==(const BoundingBox&, const BoundingBox&) = default;

  private:
    double min_latitude_deg_;
    double max_latitude_deg_;
    double min_longitude_deg_;
    double max_longitude_deg_;
};

/** @brief Circle of a positive radius in metres around a center. */
class Circle final {
  public:
    /**
     * @param center Circle center.
     * @param radius_m Radius in metres, must be positive.
     * @param system Distance model used by the containment test.
     */
    Circle(Position center, double radius_m, CoordinateSystem system = CoordinateSystem::Cartesian);

    [[nodiscard]] const Position& center() const noexcept { return center_; }
    [[nodiscard]] double radius() const noexcept { return radius_m_; }
    [[nodiscard]] CoordinateSystem coordinate_system() const noexcept { return coordinate_system_; }

    [[nodiscard]] bool contains(const Position& position) const;
    [[nodiscard]] BoundingBox bounding_box() const;
    /** @brief Uniform over the disc: radius scaled by the square root of a uniform draw. */
    [[nodiscard]] Position random_position(SecureRandom& random) const;

    void write(MessageWriter& writer) const;
    static Circle read(MessageReader& reader);

    friend bool operator==(const Circle&, const Circle&) = default;

  private:
    Position center_;
    double radius_m_;
    CoordinateSystem coordinate_system_;
};

/** @brief Latitude/longitude rectangle given by its north-west and south-east corners. */
class Rectangle final {
  public:
    Rectangle(Position top_left, Position bottom_right);

    [[nodiscard]] const Position& top_left() const noexcept { return top_left_; }
    [[nodiscard]] const Position& bottom_right() const noexcept { return bottom_right_; }
    /** @brief Corners in order NW, NE, SE, SW. */
    [[nodiscard]] std::vector<Position> corners() const;

    [[nodiscard]] bool contains(const Position& position) const noexcept;
    [[nodiscard]] BoundingBox bounding_box() const;
    [[nodiscard]] Position random_position(SecureRandom& random) const;

    void write(MessageWriter& writer) const;
    static Rectangle read(MessageReader& reader);

    friend bool operator==(const Rectangle&, const Rectangle&) = default;

  private:
    Position top_left_;
    Position bottom_right_;
};

/** @brief Simple polygon of at least three vertices; the closing edge is implicit. */
class Polygon final {
  public:
    explicit Polygon(std::vector<Position> points);

    [[nodiscard]] const std::vector<Position>& points() const noexcept { return list_points_; }

    /** @brief Even-odd point-in-polygon test; points on an edge are inside. */
    [[nodiscard]] bool contains(const Position& position) const noexcept;
    [[nodiscard]] BoundingBox bounding_box() const;
    /** @brief Rejection sampling inside the bounding box. */
    [[nodiscard]] Position random_position(SecureRandom& random) const;

    void write(MessageWriter& writer) const;
    static Polygon read(MessageReader& reader);

    friend bool operator==(const Polygon&, const Polygon&) = default;

  private:
    std::vector<Position> list_points_;
};

class Area;

/**
 * @brief Union of member areas; members may themselves be unions.
 *
 * An empty union is valid and contains or intersects nothing.
 */
class AreaUnion final {
  public:
    explicit AreaUnion(std::vector<Area> members);
    AreaUnion(const AreaUnion& other);
    AreaUnion(AreaUnion&& other) noexcept;
    AreaUnion& operator=(const AreaUnion& other);
    AreaUnion& operator=(AreaUnion&& other) noexcept;
    ~AreaUnion();

    [[nodiscard]] const std::vector<Area>& members() const noexcept { return list_members_; }

    friend bool operator==(const AreaUnion& lhs, const AreaUnion& rhs);

  private:
    std::vector<Area> list_members_;
};

class Area final {
  public:
    using Shape = std::variant<Circle, Rectangle, Polygon, AreaUnion>;

    Area(Circle circle);
    Area(Rectangle rectangle);
    Area(Polygon polygon);
    Area(AreaUnion area_union);

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }

    [[nodiscard]] bool contains(const Position& position) const;
    [[nodiscard]] bool intersects(const Area& other) const;
    /** @brief Throws std::invalid_argument for an area with no extent (an empty union). */
    [[nodiscard]] BoundingBox bounding_box() const;

    /**
     * @brief Random position inside the area.
     *
     * A union picks one member uniformly and samples it, which is not
     * area-weighted over the union as a whole. Throws std::invalid_argument
     * for an empty union.
     */
    [[nodiscard]] Position random_position(SecureRandom& random) const;
    /** @brief random_position() drawing from the calling thread's generator. */
    [[nodiscard]] Position random_position() const;

    /** @brief Union of this area and @p other (not flattened). */
    [[nodiscard]] Area union_with(const Area& other) const;
    static Area create_union(std::vector<Area> areas);

    void write(MessageWriter& writer) const;
    static Area read(MessageReader& reader);
    [[nodiscard]] std::string to_json() const;

    friend bool operator==(const Area& lhs, const Area& rhs);

  private:
    Shape shape_;
};

}  // namespace maritime_relay
