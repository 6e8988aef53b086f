#include "maritime_relay/service_locator.hpp"

#include <algorithm>
#include <limits>

namespace maritime_relay {

ServiceLocator::ServiceLocator(const TargetRegistry& registry)
    : registry_(registry),
      logger_(get_logger()) {}

std::vector<LocatedTarget> ServiceLocator::find_services(const Id160& requester_id, const LocateRequest& request) const {
    const double radius_m = request.radius_m.has_value() && *request.radius_m > 0
        ? static_cast<double>(*request.radius_m)
        : std::numeric_limits<double>::max();
    const std::size_t max_results = request.max_results.has_value() && *request.max_results > 0
        ? static_cast<std::size_t>(*request.max_results)
        : std::numeric_limits<std::size_t>::max();
    const std::optional<Position>& sender_position = request.sender_position;

    std::vector<LocatedTarget> list_located;
    registry_.for_each_target([&](const Target& target, const PositionTime& position) {
        if (target.id() == requester_id || !target.has_endpoint(request.endpoint_name)) {
            return;
        }
        if (!sender_position.has_value()) {
            list_located.push_back(LocatedTarget{target.id(), position, std::nullopt});
            return;
        }
        const double distance_m = position.geodesic_distance_to(*sender_position);
        if (distance_m <= radius_m) {
            list_located.push_back(LocatedTarget{target.id(), position, distance_m});
        }
    });

    if (sender_position.has_value()) {
        std::stable_sort(list_located.begin(), list_located.end(), [](const LocatedTarget& lhs, const LocatedTarget& rhs) {
            return *lhs.distance_m < *rhs.distance_m;
        });
    }
    if (list_located.size() > max_results) {
        list_located.erase(list_located.begin() + static_cast<std::ptrdiff_t>(max_results), list_located.end());
    }
    return list_located;
}

std::vector<std::string> ServiceLocator::locate(const Id160& requester_id, const LocateRequest& request) const {
    const std::vector<LocatedTarget> list_located = find_services(requester_id, request);
    std::vector<std::string> list_ids;
    list_ids.reserve(list_located.size());
    for (const LocatedTarget& located : list_located) {
        list_ids.push_back(located.id.to_string());
    }
    log_event(*logger_, spdlog::level::debug,
              {{"component", "locator"},
               {"requester", requester_id.to_string()},
               {"endpoint", request.endpoint_name},
               {"positioned", request.sender_position.has_value()},
               {"results", list_ids.size()}});
    return list_ids;
}

}  // namespace maritime_relay
