#include "maritime_relay/area.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <type_traits>

#include <fmt/format.h>

#include "maritime_relay/coordinate_converter.hpp"
#include "maritime_relay/errors.hpp"
#include "maritime_relay/json_codec.hpp"

namespace maritime_relay {

namespace {

constexpr double k_metres_per_degree{k_earth_radius_m * std::numbers::pi / 180.0};
constexpr int k_max_polygon_sampling_attempts{100'000};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

constexpr std::int32_t k_wire_cartesian{0};
constexpr std::int32_t k_wire_geodesic{1};

std::int32_t coordinate_system_to_wire(CoordinateSystem system) noexcept {
    return system == CoordinateSystem::Geodesic ? k_wire_geodesic : k_wire_cartesian;
}

CoordinateSystem coordinate_system_from_wire(std::int32_t value) {
    switch (value) {
        case k_wire_cartesian:
            return CoordinateSystem::Cartesian;
        case k_wire_geodesic:
            return CoordinateSystem::Geodesic;
        default:
            throw DecodeError(fmt::format("Unknown coordinate system {}", value));
    }
}

/**
 * @brief Uniform draw in [least, bound); collapses to @p least for a zero-width range.
 */
double uniform_between(SecureRandom& random, double least, double bound) {
    if (!(least < bound)) {
        return least;
    }
    return random.next_double(least, bound);
}

/**
 * @brief Sign of the cross product (b - a) x (c - a) in the longitude/latitude plane.
 */
int orientation(const Position& a, const Position& b, const Position& c) {
    const double cross = (b.longitude() - a.longitude()) * (c.latitude() - a.latitude())
        - (b.latitude() - a.latitude()) * (c.longitude() - a.longitude());
    if (cross > 0.0) {
        return 1;
    }
    return cross < 0.0 ? -1 : 0;
}

bool within_segment_bounds(const Position& a, const Position& b, const Position& point) {
    return point.longitude() >= std::min(a.longitude(), b.longitude())
        && point.longitude() <= std::max(a.longitude(), b.longitude())
        && point.latitude() >= std::min(a.latitude(), b.latitude())
        && point.latitude() <= std::max(a.latitude(), b.latitude());
}

bool segments_intersect(const Position& p1, const Position& p2, const Position& q1, const Position& q2) {
    const int o1 = orientation(p1, p2, q1);
    const int o2 = orientation(p1, p2, q2);
    const int o3 = orientation(q1, q2, p1);
    const int o4 = orientation(q1, q2, p2);

    if (o1 != o2 && o3 != o4) {
        return true;
    }
    return (o1 == 0 && within_segment_bounds(p1, p2, q1))
        || (o2 == 0 && within_segment_bounds(p1, p2, q2))
        || (o3 == 0 && within_segment_bounds(q1, q2, p1))
        || (o4 == 0 && within_segment_bounds(q1, q2, p2));
}

bool ring_contains(const std::vector<Position>& ring, const Position& position) {
    bool inside = false;
    const std::size_t count = ring.size();
    for (std::size_t index = 0, previous = count - 1; index < count; previous = index++) {
        const Position& a = ring[previous];
        const Position& b = ring[index];
        if (orientation(a, b, position) == 0 && within_segment_bounds(a, b, position)) {
            return true;
        }
        const bool crosses = (b.latitude() > position.latitude()) != (a.latitude() > position.latitude());
        if (crosses) {
            const double crossing_longitude = b.longitude()
                + (position.latitude() - b.latitude()) * (a.longitude() - b.longitude()) / (a.latitude() - b.latitude());
            if (position.longitude() < crossing_longitude) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool rings_intersect(const std::vector<Position>& first, const std::vector<Position>& second) {
    for (std::size_t i = 0; i < first.size(); ++i) {
        const Position& a1 = first[i];
        const Position& a2 = first[(i + 1) % first.size()];
        for (std::size_t j = 0; j < second.size(); ++j) {
            if (segments_intersect(a1, a2, second[j], second[(j + 1) % second.size()])) {
                return true;
            }
        }
    }
    return ring_contains(first, second.front()) || ring_contains(second, first.front());
}

/**
 * @brief Shortest planar distance in metres from the converter's anchor to segment [a, b].
 */
double anchor_to_segment_distance_m(const CoordinateConverter& converter, const Position& a, const Position& b) {
    const PlanarPoint start = converter.to_planar(a);
    const PlanarPoint end = converter.to_planar(b);
    const double dx = end.x_m - start.x_m;
    const double dy = end.y_m - start.y_m;
    const double length_squared = dx * dx + dy * dy;
    double t = 0.0;
    if (length_squared > 0.0) {
        t = std::clamp(-(start.x_m * dx + start.y_m * dy) / length_squared, 0.0, 1.0);
    }
    const double nearest_x = start.x_m + t * dx;
    const double nearest_y = start.y_m + t * dy;
    return std::hypot(nearest_x, nearest_y);
}

bool circle_intersects_circle(const Circle& first, const Circle& second) {
    return first.center().distance_to(second.center(), first.coordinate_system()) <= first.radius() + second.radius();
}

bool circle_intersects_rectangle(const Circle& circle, const Rectangle& rectangle) {
    const Position& center = circle.center();
    const Position nearest{
        std::clamp(center.latitude(), rectangle.bottom_right().latitude(), rectangle.top_left().latitude()),
        std::clamp(center.longitude(), rectangle.top_left().longitude(), rectangle.bottom_right().longitude())
    };
    return circle.contains(nearest);
}

bool circle_intersects_ring(const Circle& circle, const std::vector<Position>& ring) {
    if (ring_contains(ring, circle.center())) {
        return true;
    }
    const CoordinateConverter converter{circle.center()};
    for (std::size_t index = 0; index < ring.size(); ++index) {
        const Position& a = ring[index];
        const Position& b = ring[(index + 1) % ring.size()];
        if (circle.contains(a) || anchor_to_segment_distance_m(converter, a, b) <= circle.radius()) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Pairwise intersection of two non-union shapes, argument order normalized.
 */
bool shapes_intersect(const Area::Shape& first, const Area::Shape& second) {
    return std::visit(
        Overloaded{
            [](const Circle& a, const Circle& b) { return circle_intersects_circle(a, b); },
            [](const Circle& a, const Rectangle& b) { return circle_intersects_rectangle(a, b); },
            [](const Rectangle& a, const Circle& b) { return circle_intersects_rectangle(b, a); },
            [](const Circle& a, const Polygon& b) { return circle_intersects_ring(a, b.points()); },
            [](const Polygon& a, const Circle& b) { return circle_intersects_ring(b, a.points()); },
            [](const Rectangle& a, const Rectangle& b) { return a.bounding_box().intersects(b.bounding_box()); },
            [](const Rectangle& a, const Polygon& b) { return rings_intersect(a.corners(), b.points()); },
            [](const Polygon& a, const Rectangle& b) { return rings_intersect(a.points(), b.corners()); },
            [](const Polygon& a, const Polygon& b) { return rings_intersect(a.points(), b.points()); },
            [](const auto&, const auto&) { return false; },
        },
        first,
        second
    );
}

}  // namespace

// --- BoundingBox -------------------------------------------------------------

BoundingBox::BoundingBox(double min_latitude_deg, double max_latitude_deg, double min_longitude_deg, double max_longitude_deg)
    : min_latitude_deg_(min_latitude_deg),
      max_latitude_deg_(max_latitude_deg),
      min_longitude_deg_(min_longitude_deg),
      max_longitude_deg_(max_longitude_deg) {
    if (!Position::is_valid_latitude(min_latitude_deg) || !Position::is_valid_latitude(max_latitude_deg)
        || !Position::is_valid_longitude(min_longitude_deg) || !Position::is_valid_longitude(max_longitude_deg)) {
        throw std::invalid_argument("BoundingBox corners must be valid coordinates");
    }
    if (min_latitude_deg > max_latitude_deg || min_longitude_deg > max_longitude_deg) {
        throw std::invalid_argument(fmt::format("BoundingBox is inverted: lat [{}, {}] lon [{}, {}]",
                                                min_latitude_deg,
                                                max_latitude_deg,
                                                min_longitude_deg,
                                                max_longitude_deg));
    }
}

Position BoundingBox::top_left() const {
    return Position{max_latitude_deg_, min_longitude_deg_};
}

Position BoundingBox::bottom_right() const {
    return Position{min_latitude_deg_, max_longitude_deg_};
}

bool BoundingBox::contains(const Position& position) const noexcept {
    return position.latitude() >= min_latitude_deg_ && position.latitude() <= max_latitude_deg_
        && position.longitude() >= min_longitude_deg_ && position.longitude() <= max_longitude_deg_;
}

bool BoundingBox::intersects(const BoundingBox& other) const noexcept {
    return min_latitude_deg_ <= other.max_latitude_deg_ && other.min_latitude_deg_ <= max_latitude_deg_
        && min_longitude_deg_ <= other.max_longitude_deg_ && other.min_longitude_deg_ <= max_longitude_deg_;
}

BoundingBox BoundingBox::merged_with(const BoundingBox& other) const {
    return BoundingBox{
        std::min(min_latitude_deg_, other.min_latitude_deg_),
        std::max(max_latitude_deg_, other.max_latitude_deg_),
        std::min(min_longitude_deg_, other.min_longitude_deg_),
        std::max(max_longitude_deg_, other.max_longitude_deg_)
    };
}

// --- Circle ------------------------------------------------------------------

Circle::Circle(Position center, double radius_m, CoordinateSystem system)
    : center_(center),
      radius_m_(radius_m),
      coordinate_system_(system) {
    if (!(radius_m_ > 0.0)) {
        throw std::invalid_argument(fmt::format("Circle radius must be positive, got {}", radius_m_));
    }
}

bool Circle::contains(const Position& position) const {
    return center_.distance_to(position, coordinate_system_) <= radius_m_;
}

BoundingBox Circle::bounding_box() const {
    const double latitude_delta = radius_m_ / k_metres_per_degree;
    const double parallel_scale = std::cos(center_.latitude() * std::numbers::pi / 180.0);
    const double min_latitude = std::max(-90.0, center_.latitude() - latitude_delta);
    const double max_latitude = std::min(90.0, center_.latitude() + latitude_delta);
    if (min_latitude <= -90.0 || max_latitude >= 90.0 || parallel_scale <= 0.0) {
        return BoundingBox{min_latitude, max_latitude, -180.0, 180.0};
    }
    const double longitude_delta = radius_m_ / (k_metres_per_degree * parallel_scale);
    const double min_longitude = center_.longitude() - longitude_delta;
    const double max_longitude = center_.longitude() + longitude_delta;
    // A circle reaching over the antimeridian wraps; bound it by the full longitude span.
    if (min_longitude < -180.0 || max_longitude > 180.0) {
        return BoundingBox{min_latitude, max_latitude, -180.0, 180.0};
    }
    return BoundingBox{min_latitude, max_latitude, min_longitude, max_longitude};
}

Position Circle::random_position(SecureRandom& random) const {
    const double distance_m = radius_m_ * std::sqrt(random.next_double());
    const double angle_rad = random.next_double(2.0 * std::numbers::pi);
    const CoordinateConverter converter{center_};
    return converter.to_position(PlanarPoint{distance_m * std::cos(angle_rad), distance_m * std::sin(angle_rad)});
}

void Circle::write(MessageWriter& writer) const {
    write_message_of(writer, 1, "center", center_);
    writer.write_double(2, "radius", radius_m_);
    writer.write_int32(3, "coordinateSystem", coordinate_system_to_wire(coordinate_system_));
}

Circle Circle::read(MessageReader& reader) {
    const Position center = read_message_as<Position>(reader, 1, "center");
    const double radius_m = reader.read_double(2, "radius");
    if (!(radius_m > 0.0)) {
        throw DecodeError(fmt::format("Encoded circle radius must be positive, got {}", radius_m));
    }
    CoordinateSystem system = CoordinateSystem::Cartesian;
    if (reader.is_next(3, "coordinateSystem")) {
        system = coordinate_system_from_wire(reader.read_int32(3, "coordinateSystem"));
    }
    return Circle{center, radius_m, system};
}

// --- Rectangle ---------------------------------------------------------------

Rectangle::Rectangle(Position top_left, Position bottom_right)
    : top_left_(top_left),
      bottom_right_(bottom_right) {
    if (top_left_.latitude() < bottom_right_.latitude() || top_left_.longitude() > bottom_right_.longitude()) {
        throw std::invalid_argument(fmt::format("Rectangle corners must be north-west {} then south-east {}",
                                                top_left_.to_string(),
                                                bottom_right_.to_string()));
    }
}

std::vector<Position> Rectangle::corners() const {
    return {
        top_left_,
        Position{top_left_.latitude(), bottom_right_.longitude()},
        bottom_right_,
        Position{bottom_right_.latitude(), top_left_.longitude()},
    };
}

bool Rectangle::contains(const Position& position) const noexcept {
    return position.latitude() <= top_left_.latitude() && position.latitude() >= bottom_right_.latitude()
        && position.longitude() >= top_left_.longitude() && position.longitude() <= bottom_right_.longitude();
}

BoundingBox Rectangle::bounding_box() const {
    return BoundingBox{bottom_right_.latitude(), top_left_.latitude(), top_left_.longitude(), bottom_right_.longitude()};
}

Position Rectangle::random_position(SecureRandom& random) const {
    const double latitude = uniform_between(random, bottom_right_.latitude(), top_left_.latitude());
    const double longitude = uniform_between(random, top_left_.longitude(), bottom_right_.longitude());
    return Position{latitude, longitude};
}

void Rectangle::write(MessageWriter& writer) const {
    write_message_of(writer, 1, "topLeft", top_left_);
    write_message_of(writer, 2, "bottomRight", bottom_right_);
}

Rectangle Rectangle::read(MessageReader& reader) {
    const Position top_left = read_message_as<Position>(reader, 1, "topLeft");
    const Position bottom_right = read_message_as<Position>(reader, 2, "bottomRight");
    if (top_left.latitude() < bottom_right.latitude() || top_left.longitude() > bottom_right.longitude()) {
        throw DecodeError("Encoded rectangle corners are inverted");
    }
    return Rectangle{top_left, bottom_right};
}

// --- Polygon -----------------------------------------------------------------

Polygon::Polygon(std::vector<Position> points)
    : list_points_(std::move(points)) {
    if (list_points_.size() < 3) {
        throw std::invalid_argument(fmt::format("Polygon requires at least 3 points, got {}", list_points_.size()));
    }
}

bool Polygon::contains(const Position& position) const noexcept {
    return ring_contains(list_points_, position);
}

BoundingBox Polygon::bounding_box() const {
    const auto [min_lat, max_lat] = std::minmax_element(
        list_points_.begin(), list_points_.end(),
        [](const Position& a, const Position& b) { return a.latitude() < b.latitude(); }
    );
    const auto [min_lon, max_lon] = std::minmax_element(
        list_points_.begin(), list_points_.end(),
        [](const Position& a, const Position& b) { return a.longitude() < b.longitude(); }
    );
    return BoundingBox{min_lat->latitude(), max_lat->latitude(), min_lon->longitude(), max_lon->longitude()};
}

Position Polygon::random_position(SecureRandom& random) const {
    const BoundingBox box = bounding_box();
    for (int attempt = 0; attempt < k_max_polygon_sampling_attempts; ++attempt) {
        const Position candidate{
            uniform_between(random, box.min_latitude(), box.max_latitude()),
            uniform_between(random, box.min_longitude(), box.max_longitude())
        };
        if (contains(candidate)) {
            return candidate;
        }
    }
    throw std::invalid_argument("Polygon encloses no area to sample from");
}

void Polygon::write(MessageWriter& writer) const {
    writer.write_message_list(1, "points", list_points_.size(), [this](std::size_t index, MessageWriter& nested) {
        list_points_[index].write(nested);
    });
}

Polygon Polygon::read(MessageReader& reader) {
    std::vector<Position> points;
    reader.read_message_list(1, "points", [&points](MessageReader& nested) {
        points.push_back(Position::read(nested));
    });
    if (points.size() < 3) {
        throw DecodeError(fmt::format("Encoded polygon has {} points; at least 3 required", points.size()));
    }
    return Polygon{std::move(points)};
}

// --- AreaUnion ---------------------------------------------------------------

AreaUnion::AreaUnion(std::vector<Area> members)
    : list_members_(std::move(members)) {}

AreaUnion::AreaUnion(const AreaUnion& other) = default;
AreaUnion::AreaUnion(AreaUnion&& other) noexcept = default;
AreaUnion& AreaUnion::operator=(const AreaUnion& other) = default;
AreaUnion& AreaUnion::operator=(AreaUnion&& other) noexcept = default;
AreaUnion::~AreaUnion() = default;

bool operator==(const AreaUnion& lhs, const AreaUnion& rhs) {
    return lhs.list_members_ == rhs.list_members_;
}

// --- Area --------------------------------------------------------------------

Area::Area(Circle circle)
    : shape_(std::move(circle)) {}

Area::Area(Rectangle rectangle)
    : shape_(std::move(rectangle)) {}

Area::Area(Polygon polygon)
    : shape_(std::move(polygon)) {}

Area::Area(AreaUnion area_union)
    : shape_(std::move(area_union)) {}

bool Area::contains(const Position& position) const {
    return std::visit(
        Overloaded{
            [&position](const AreaUnion& area_union) {
                return std::any_of(area_union.members().begin(), area_union.members().end(),
                                   [&position](const Area& member) { return member.contains(position); });
            },
            [&position](const auto& shape) { return shape.contains(position); },
        },
        shape_
    );
}

bool Area::intersects(const Area& other) const {
    if (const auto* area_union = std::get_if<AreaUnion>(&shape_)) {
        return std::any_of(area_union->members().begin(), area_union->members().end(),
                           [&other](const Area& member) { return member.intersects(other); });
    }
    if (const auto* other_union = std::get_if<AreaUnion>(&other.shape_)) {
        return std::any_of(other_union->members().begin(), other_union->members().end(),
                           [this](const Area& member) { return intersects(member); });
    }
    if (!bounding_box().intersects(other.bounding_box())) {
        return false;
    }
    return shapes_intersect(shape_, other.shape_);
}

BoundingBox Area::bounding_box() const {
    return std::visit(
        Overloaded{
            [](const AreaUnion& area_union) {
                if (area_union.members().empty()) {
                    throw std::invalid_argument("An empty area union has no bounding box");
                }
                BoundingBox box = area_union.members().front().bounding_box();
                for (auto iterator = std::next(area_union.members().begin()); iterator != area_union.members().end(); ++iterator) {
                    box = box.merged_with(iterator->bounding_box());
                }
                return box;
            },
            [](const auto& shape) { return shape.bounding_box(); },
        },
        shape_
    );
}

Position Area::random_position(SecureRandom& random) const {
    return std::visit(
        Overloaded{
            [&random](const AreaUnion& area_union) {
                const std::vector<Area>& members = area_union.members();
                if (members.empty()) {
                    throw std::invalid_argument("Cannot sample a position from an empty area union");
                }
                const auto index = static_cast<std::size_t>(random.next_int(static_cast<std::int32_t>(members.size())));
                return members[index].random_position(random);
            },
            [&random](const auto& shape) { return shape.random_position(random); },
        },
        shape_
    );
}

Position Area::random_position() const {
    return random_position(SecureRandom::current());
}

Area Area::union_with(const Area& other) const {
    return Area{AreaUnion{std::vector<Area>{*this, other}}};
}

Area Area::create_union(std::vector<Area> areas) {
    return Area{AreaUnion{std::move(areas)}};
}

void Area::write(MessageWriter& writer) const {
    std::visit(
        Overloaded{
            [&writer](const Circle& circle) { write_message_of(writer, 1, "circle", circle); },
            [&writer](const Rectangle& rectangle) { write_message_of(writer, 2, "box", rectangle); },
            [&writer](const Polygon& polygon) { write_message_of(writer, 3, "polygon", polygon); },
            [&writer](const AreaUnion& area_union) {
                const std::vector<Area>& members = area_union.members();
                writer.write_message_list(4, "areas", members.size(), [&members](std::size_t index, MessageWriter& nested) {
                    members[index].write(nested);
                });
            },
        },
        shape_
    );
}

Area Area::read(MessageReader& reader) {
    if (reader.is_next(1, "circle")) {
        return Area{read_message_as<Circle>(reader, 1, "circle")};
    }
    if (reader.is_next(2, "box")) {
        return Area{read_message_as<Rectangle>(reader, 2, "box")};
    }
    if (reader.is_next(3, "polygon")) {
        return Area{read_message_as<Polygon>(reader, 3, "polygon")};
    }
    if (!reader.is_next(4, "areas")) {
        throw DecodeError("Unrecognized area discriminant; expected circle(1), box(2), polygon(3) or areas(4)");
    }
    std::vector<Area> members;
    reader.read_message_list(4, "areas", [&members](MessageReader& nested) {
        members.push_back(Area::read(nested));
    });
    return Area{AreaUnion{std::move(members)}};
}

std::string Area::to_json() const {
    return write_json(*this);
}

bool operator==(const Area& lhs, const Area& rhs) {
    return lhs.shape_ == rhs.shape_;
}

}  // namespace maritime_relay
