#include <catch2/catch.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging_test_fixture.hpp"
#include "maritime_relay/area.hpp"
#include "maritime_relay/endpoint_service.hpp"
#include "maritime_relay/secure_random.hpp"
#include "maritime_relay/service_locator.hpp"
#include "maritime_relay/target_registry.hpp"

using namespace maritime_relay;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    maritime_relay::test::ensure_logger_initialized();
    return true;
}();

const Timestamp k_report_time = timestamp_from_millis(1'700'000'000'000);

Id160 make_id(int value) {
    Id160::Bytes bytes{};
    bytes[19] = static_cast<std::uint8_t>(value);
    return Id160{bytes};
}

void place(TargetRegistry& registry, const Id160& id, double latitude, double longitude, const std::string& endpoint) {
    registry.update_position(id, PositionTime{latitude, longitude, k_report_time});
    registry.register_endpoint(id, endpoint);
}

LocateRequest make_request(std::string endpoint, std::int32_t radius_m, std::int32_t max_results, std::optional<Position> sender) {
    LocateRequest request{};
    request.endpoint_name = std::move(endpoint);
    request.radius_m = radius_m;
    request.max_results = max_results;
    request.sender_position = sender;
    return request;
}

}  // namespace

TEST_CASE("Locate excludes the requester and far targets") {
    TargetRegistry registry{};
    const Id160 a = make_id(1);
    const Id160 b = make_id(2);
    const Id160 c = make_id(3);
    place(registry, a, 0.0, 0.0, "ais");
    place(registry, b, 0.0, 0.001, "ais");
    place(registry, c, 10.0, 10.0, "ais");

    const ServiceLocator locator{registry};
    const LocateRequest request = make_request("ais", 200, 5, Position{0.0, 0.0});

    SECTION("requester is target A") {
        REQUIRE(locator.locate(a, request) == std::vector<std::string>{b.to_string()});
    }

    SECTION("requester is a separate target at A's position") {
        const Id160 d = make_id(4);
        REQUIRE(locator.locate(d, request) == std::vector<std::string>{a.to_string(), b.to_string()});
    }
}

TEST_CASE("Positioned results are ordered by distance and capped") {
    TargetRegistry registry{};
    const Id160 requester = make_id(100);
    for (int index = 1; index <= 10; ++index) {
        // Inserted far-to-near so ordering cannot come from insertion order.
        place(registry, make_id(index), 0.0, 0.01 * (11 - index), "ais");
    }
    place(registry, make_id(50), 0.0, 0.001, "radar");

    const ServiceLocator locator{registry};
    const Position sender{0.0, 0.0};

    const std::vector<LocatedTarget> all = locator.find_services(requester, make_request("ais", 0, 0, sender));
    REQUIRE(all.size() == 10);
    REQUIRE(std::is_sorted(all.begin(), all.end(), [](const LocatedTarget& lhs, const LocatedTarget& rhs) {
        return *lhs.distance_m < *rhs.distance_m;
    }));
    REQUIRE(all.front().id == make_id(10));

    const std::vector<LocatedTarget> capped = locator.find_services(requester, make_request("ais", 5'000, 3, sender));
    REQUIRE(capped.size() == 3);
    for (const LocatedTarget& located : capped) {
        REQUIRE(located.distance_m.has_value());
        REQUIRE(*located.distance_m <= 5'000.0);
        REQUIRE(located.id != requester);
    }
    REQUIRE(capped[0].id == make_id(10));
    REQUIRE(capped[1].id == make_id(9));
    REQUIRE(capped[2].id == make_id(8));
}

TEST_CASE("Locate without a sender position ignores the radius") {
    TargetRegistry registry{};
    place(registry, make_id(1), 0.0, 0.0, "ais");
    place(registry, make_id(2), 60.0, 100.0, "ais");
    place(registry, make_id(3), -45.0, -120.0, "ais");

    const ServiceLocator locator{registry};
    const std::vector<LocatedTarget> results = locator.find_services(make_id(9), make_request("ais", 1, 0, std::nullopt));
    REQUIRE(results.size() == 3);
    for (const LocatedTarget& located : results) {
        REQUIRE_FALSE(located.distance_m.has_value());
    }

    REQUIRE(locator.find_services(make_id(9), make_request("ais", 1, 2, std::nullopt)).size() == 2);
}

TEST_CASE("Locate skips targets without the endpoint or without a position") {
    TargetRegistry registry{};
    place(registry, make_id(1), 0.0, 0.0, "radar");
    registry.register_endpoint(make_id(2), "ais");

    const ServiceLocator locator{registry};
    REQUIRE(locator.locate(make_id(9), make_request("ais", 0, 0, Position{0.0, 0.0})).empty());
}

TEST_CASE("Endpoint service withdraws endpoints from locate results") {
    TargetRegistry registry{};
    EndpointService service{registry};
    const Id160 vessel = make_id(1);
    const Id160 requester = make_id(2);
    registry.update_position(vessel, PositionTime{0.0, 0.0, k_report_time});

    service.register_endpoint(vessel, "ais");
    service.register_endpoint(vessel, "ais");
    REQUIRE(registry.find(vessel)->endpoints == std::vector<std::string>{"ais"});

    const LocateRequest request = make_request("ais", 1'000, 5, Position{0.0, 0.0});
    REQUIRE(service.locate(requester, request) == std::vector<std::string>{vessel.to_string()});

    service.unregister_endpoint(vessel, "ais");
    service.unregister_endpoint(vessel, "ais");
    REQUIRE(service.locate(requester, request).empty());

    REQUIRE_THROWS_AS(service.register_endpoint(vessel, ""), std::invalid_argument);
    REQUIRE_THROWS_AS(service.locate(requester, make_request("", 0, 0, std::nullopt)), std::invalid_argument);
}

TEST_CASE("Every located target lies within the radius") {
    TargetRegistry registry{};
    SecureRandom& random = SecureRandom::current();
    const Position sender{55.0, 12.0};
    const Circle area{sender, 50'000.0};
    for (int index = 0; index < 200; ++index) {
        place(registry, random.next_id160(), 0.0, 0.0, "ais");
    }
    registry.for_each_target([&registry, &area, &random](const Target& target, const PositionTime&) {
        registry.update_position(target.id(), PositionTime{area.random_position(random), k_report_time});
    });

    const ServiceLocator locator{registry};
    const Id160 requester = random.next_id160();
    const std::vector<LocatedTarget> results = locator.find_services(requester, make_request("ais", 20'000, 0, sender));
    REQUIRE_FALSE(results.empty());
    for (const LocatedTarget& located : results) {
        REQUIRE(located.position.geodesic_distance_to(sender) <= 20'000.0);
        REQUIRE(located.id != requester);
    }
}
