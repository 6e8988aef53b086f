#include "maritime_relay/target_connection.hpp"

#include <utility>

namespace maritime_relay {

TargetConnection::TargetConnection(Id160 target_id, TargetRegistry& registry, ConnectionListenerList listeners)
    : target_id_(target_id),
      registry_(registry),
      dispatcher_(std::move(listeners), [this](bool connected) { on_connectivity_changed(connected); }) {}

void TargetConnection::on_connectivity_changed(bool connected) {
    flag_connected_.store(connected);
    registry_.set_connected(target_id_, connected);
}

}  // namespace maritime_relay
