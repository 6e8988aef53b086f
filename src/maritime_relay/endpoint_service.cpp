#include "maritime_relay/endpoint_service.hpp"

#include <stdexcept>

namespace maritime_relay {

namespace {
void require_endpoint_name(std::string_view endpoint_name) {
    if (endpoint_name.empty()) {
        throw std::invalid_argument("Endpoint name cannot be empty");
    }
}
}  // namespace

EndpointService::EndpointService(TargetRegistry& registry)
    : registry_(registry),
      locator_(registry),
      logger_(get_logger()) {}

void EndpointService::register_endpoint(const Id160& requester_id, const std::string& endpoint_name) {
    require_endpoint_name(endpoint_name);
    const bool added = registry_.register_endpoint(requester_id, endpoint_name);
    log_event(*logger_, spdlog::level::debug,
              {{"component", "endpoints"},
               {"event", "register"},
               {"target", requester_id.to_string()},
               {"endpoint", endpoint_name},
               {"changed", added}});
}

void EndpointService::unregister_endpoint(const Id160& requester_id, const std::string& endpoint_name) {
    require_endpoint_name(endpoint_name);
    const bool removed = registry_.unregister_endpoint(requester_id, endpoint_name);
    log_event(*logger_, spdlog::level::debug,
              {{"component", "endpoints"},
               {"event", "unregister"},
               {"target", requester_id.to_string()},
               {"endpoint", endpoint_name},
               {"changed", removed}});
}

std::vector<std::string> EndpointService::locate(const Id160& requester_id, const LocateRequest& request) const {
    require_endpoint_name(request.endpoint_name);
    return locator_.locate(requester_id, request);
}

}  // namespace maritime_relay
