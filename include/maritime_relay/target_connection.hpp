// === Target Connection =======================================================
//
// Server-side view of one target's live connection. Owns the event dispatcher
// that fans lifecycle and traffic events out to the configured listeners and
// keeps the registry's connectivity flag in step: on connected/disconnected the
// flag is written once, before any listener runs.

#pragma once

#include <atomic>
#include <memory>

#include "maritime_relay/connection_events.hpp"
#include "maritime_relay/id160.hpp"
#include "maritime_relay/target_registry.hpp"

namespace maritime_relay {

class TargetConnection final {
  public:
    TargetConnection(Id160 target_id, TargetRegistry& registry, ConnectionListenerList listeners = {});

    TargetConnection(const TargetConnection&) = delete;
    TargetConnection& operator=(const TargetConnection&) = delete;

    [[nodiscard]] const Id160& target_id() const noexcept { return target_id_; }
    [[nodiscard]] bool is_connected() const noexcept { return flag_connected_.load(); }

    /** @brief Sink the transport reports events to. */
    [[nodiscard]] ConnectionEventDispatcher& events() noexcept { return dispatcher_; }

  private:
    void on_connectivity_changed(bool connected);

    const Id160 target_id_;
    TargetRegistry& registry_;
    std::atomic<bool> flag_connected_{false};
    ConnectionEventDispatcher dispatcher_;
};

}  // namespace maritime_relay
