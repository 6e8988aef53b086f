// === Service Locator =========================================================
//
// Answers "which targets near me offer endpoint X". Scans the target registry,
// keeps targets advertising the endpoint (and, when the requester supplied a
// position, lying within the radius by great-circle distance), drops the
// requester itself, and orders the result by distance.
//
// Without a requester position the radius is ignored and results keep the
// registry's iteration order.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "maritime_relay/id160.hpp"
#include "maritime_relay/logging.hpp"
#include "maritime_relay/position.hpp"
#include "maritime_relay/target_registry.hpp"

namespace maritime_relay {

/** @brief Parameters of a locate call as received from a target. */
struct LocateRequest final {
    std::string endpoint_name{};                    /**< Endpoint the requester is looking for. */
    std::optional<std::int32_t> radius_m{};         /**< Search radius in metres; absent or <= 0 is unbounded. */
    std::optional<std::int32_t> max_results{};      /**< Result cap; absent or <= 0 is unbounded. */
    std::optional<Position> sender_position{};      /**< Requester's position, if known. */
};

/** @brief One locate hit together with the fix it was matched on. */
struct LocatedTarget final {
    Id160 id{};
    PositionTime position;
    std::optional<double> distance_m{};  /**< Geodesic distance to the requester when a position was supplied. */
};

class ServiceLocator final {
  public:
    explicit ServiceLocator(const TargetRegistry& registry);

    /** @brief Matching targets with their fixes, nearest first when positioned. */
    [[nodiscard]] std::vector<LocatedTarget> find_services(const Id160& requester_id, const LocateRequest& request) const;
    /** @brief Matching target identifiers rendered as text, in find_services order. */
    [[nodiscard]] std::vector<std::string> locate(const Id160& requester_id, const LocateRequest& request) const;

  private:
    const TargetRegistry& registry_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace maritime_relay
