#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "maritime_relay/area.hpp"
#include "maritime_relay/errors.hpp"
#include "maritime_relay/json_codec.hpp"

using namespace maritime_relay;

TEST_CASE("Each area kind is written under its discriminant") {
    const Area circle = Circle{Position{1.0, 2.0}, 300.0};
    const nlohmann::json circle_json = nlohmann::json::parse(circle.to_json());
    REQUIRE(circle_json.contains("circle"));
    REQUIRE(circle_json["circle"]["center"]["latitude"] == 1.0);
    REQUIRE(circle_json["circle"]["radius"] == 300.0);

    const Area box = Rectangle{Position{5.0, 0.0}, Position{0.0, 5.0}};
    REQUIRE(nlohmann::json::parse(box.to_json()).contains("box"));

    const Area polygon = Polygon{std::vector<Position>{Position{0.0, 0.0}, Position{0.0, 1.0}, Position{1.0, 0.0}}};
    const nlohmann::json polygon_json = nlohmann::json::parse(polygon.to_json());
    REQUIRE(polygon_json["polygon"]["points"].size() == 3);

    const nlohmann::json union_json = nlohmann::json::parse(circle.union_with(box).to_json());
    REQUIRE(union_json["areas"].size() == 2);
    REQUIRE(union_json["areas"][1].contains("box"));
}

TEST_CASE("Areas decode to equal values") {
    const Area circle = Circle{Position{-12.5, 130.25}, 7'500.0};
    const Area geodesic_circle = Circle{Position{60.0, 10.0}, 1'000.0, CoordinateSystem::Geodesic};
    const Area box = Rectangle{Position{60.0, -10.0}, Position{50.0, 2.0}};
    const Area polygon = Polygon{std::vector<Position>{Position{0.0, 0.0}, Position{0.0, 1.0}, Position{1.0, 1.0}, Position{1.0, 0.0}}};
    const Area nested = Area::create_union({circle, Area::create_union({box, polygon})});

    for (const Area& original : {circle, geodesic_circle, box, polygon, nested}) {
        const Area decoded = read_json<Area>(original.to_json());
        REQUIRE(decoded == original);
    }
}

TEST_CASE("An empty union survives encoding") {
    const Area empty = Area::create_union({});
    const Area decoded = read_json<Area>(empty.to_json());
    REQUIRE(decoded == empty);
    REQUIRE(std::holds_alternative<AreaUnion>(decoded.shape()));
    REQUIRE(std::get<AreaUnion>(decoded.shape()).members().empty());
}

TEST_CASE("Area decoding rejects unknown or malformed input") {
    REQUIRE_THROWS_AS(read_json<Area>(R"({"triangle":{}})"), DecodeError);
    REQUIRE_THROWS_AS(read_json<Area>(R"({})"), DecodeError);
    REQUIRE_THROWS_AS(read_json<Area>(R"({"circle":{"center":{"latitude":0.0,"longitude":0.0},"radius":-1.0}})"), DecodeError);
    REQUIRE_THROWS_AS(read_json<Area>(R"({"polygon":{"points":[{"latitude":0.0,"longitude":0.0}]}})"), DecodeError);
    REQUIRE_THROWS_AS(read_json<Area>(R"({"box":{"topLeft":{"latitude":0.0,"longitude":0.0}}})"), DecodeError);
    REQUIRE_THROWS_AS(read_json<Area>("{not json"), DecodeError);
}

TEST_CASE("Area decoding prefers the lowest discriminant present") {
    const Area decoded = read_json<Area>(
        R"({"box":{"topLeft":{"latitude":1.0,"longitude":0.0},"bottomRight":{"latitude":0.0,"longitude":1.0}},)"
        R"("circle":{"center":{"latitude":0.0,"longitude":0.0},"radius":10.0}})");
    REQUIRE(std::holds_alternative<Circle>(decoded.shape()));
}

TEST_CASE("Circles carry their distance model on the wire") {
    const Area geodesic = Circle{Position{60.0, 10.0}, 1'000.0, CoordinateSystem::Geodesic};
    const nlohmann::json encoded = nlohmann::json::parse(geodesic.to_json());
    REQUIRE(encoded["circle"]["coordinateSystem"] == 1);

    const Area decoded = read_json<Area>(geodesic.to_json());
    REQUIRE(std::get<Circle>(decoded.shape()).coordinate_system() == CoordinateSystem::Geodesic);
    REQUIRE(decoded == geodesic);
}

TEST_CASE("Circles without a distance model decode as Cartesian") {
    const Area decoded = read_json<Area>(R"({"circle":{"center":{"latitude":1.0,"longitude":2.0},"radius":50.0}})");
    REQUIRE(std::get<Circle>(decoded.shape()).coordinate_system() == CoordinateSystem::Cartesian);
}

TEST_CASE("Circles with an unknown distance model are rejected") {
    REQUIRE_THROWS_AS(
        read_json<Area>(R"({"circle":{"center":{"latitude":1.0,"longitude":2.0},"radius":50.0,"coordinateSystem":7}})"),
        DecodeError);
    REQUIRE_THROWS_AS(
        read_json<Area>(R"({"circle":{"center":{"latitude":1.0,"longitude":2.0},"radius":50.0,"coordinateSystem":4294967296}})"),
        DecodeError);
    REQUIRE_THROWS_AS(
        read_json<Area>(R"({"circle":{"center":{"latitude":1.0,"longitude":2.0},"radius":50.0,"coordinateSystem":"geodesic"}})"),
        DecodeError);
}
