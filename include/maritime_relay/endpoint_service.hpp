// === Endpoint Service ========================================================
//
// Server-side handlers for the endpoint calls a connected target can make:
// advertising an endpoint, withdrawing it, and locating peers that offer one.
// The transport layer resolves the calling connection to its target id and
// forwards here.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "maritime_relay/logging.hpp"
#include "maritime_relay/service_locator.hpp"
#include "maritime_relay/target_registry.hpp"

namespace maritime_relay {

class EndpointService final {
  public:
    explicit EndpointService(TargetRegistry& registry);

    /** @brief Advertise @p endpoint_name for @p requester_id. Idempotent. */
    void register_endpoint(const Id160& requester_id, const std::string& endpoint_name);
    /** @brief Withdraw @p endpoint_name for @p requester_id. Withdrawing an absent endpoint is a no-op. */
    void unregister_endpoint(const Id160& requester_id, const std::string& endpoint_name);
    /** @brief Identifiers of the targets near the requester offering the requested endpoint. */
    [[nodiscard]] std::vector<std::string> locate(const Id160& requester_id, const LocateRequest& request) const;

  private:
    TargetRegistry& registry_;
    ServiceLocator locator_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace maritime_relay
