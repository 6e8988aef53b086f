#include "maritime_relay/connection_events.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace maritime_relay {

std::string_view to_string(CloseCode close_code) noexcept {
    switch (close_code) {
        case CloseCode::Normal:
            return "normal";
        case CloseCode::GoingAway:
            return "going_away";
        case CloseCode::ProtocolError:
            return "protocol_error";
        case CloseCode::DuplicateConnect:
            return "duplicate_connect";
        case CloseCode::Timeout:
            return "timeout";
        case CloseCode::InternalError:
            return "internal_error";
    }
    return "unknown";
}

void ConnectionListener::connecting(const std::string&) {}

void ConnectionListener::connected(const std::string&, bool) {}

void ConnectionListener::disconnected(CloseCode) {}

void ConnectionListener::binary_message_received(std::span<const std::byte>) {}

void ConnectionListener::binary_message_sent(std::span<const std::byte>) {}

void ConnectionListener::text_message_received(std::string_view) {}

void ConnectionListener::text_message_sent(std::string_view) {}

ConnectionEventDispatcher::ConnectionEventDispatcher(ConnectionListenerList listeners,
                                                     ConnectivityCallback on_connectivity_changed)
    : on_connectivity_changed_(std::move(on_connectivity_changed)),
      logger_(get_logger()) {
    if (std::any_of(listeners.begin(), listeners.end(), [](const ConnectionListenerPtr& listener) { return listener == nullptr; })) {
        throw std::invalid_argument("ConnectionEventDispatcher listeners cannot be null");
    }
    listeners_.store(std::make_shared<const ConnectionListenerList>(std::move(listeners)));
}

void ConnectionEventDispatcher::connecting(const std::string& endpoint_uri) {
    dispatch("connecting", [&endpoint_uri](ConnectionListener& listener) { listener.connecting(endpoint_uri); });
}

void ConnectionEventDispatcher::connected(const std::string& endpoint_uri, bool resumed_session) {
    if (on_connectivity_changed_) {
        on_connectivity_changed_(true);
    }
    dispatch("connected", [&endpoint_uri, resumed_session](ConnectionListener& listener) {
        listener.connected(endpoint_uri, resumed_session);
    });
}

void ConnectionEventDispatcher::disconnected(CloseCode close_code) {
    if (on_connectivity_changed_) {
        on_connectivity_changed_(false);
    }
    dispatch("disconnected", [close_code](ConnectionListener& listener) { listener.disconnected(close_code); });
}

void ConnectionEventDispatcher::binary_message_received(std::span<const std::byte> message) {
    dispatch("binary_message_received", [message](ConnectionListener& listener) { listener.binary_message_received(message); });
}

void ConnectionEventDispatcher::binary_message_sent(std::span<const std::byte> message) {
    dispatch("binary_message_sent", [message](ConnectionListener& listener) { listener.binary_message_sent(message); });
}

void ConnectionEventDispatcher::text_message_received(std::string_view message) {
    dispatch("text_message_received", [message](ConnectionListener& listener) { listener.text_message_received(message); });
}

void ConnectionEventDispatcher::text_message_sent(std::string_view message) {
    dispatch("text_message_sent", [message](ConnectionListener& listener) { listener.text_message_sent(message); });
}

void ConnectionEventDispatcher::add_listener(ConnectionListenerPtr listener) {
    if (listener == nullptr) {
        throw std::invalid_argument("Cannot add a null connection listener");
    }
    std::scoped_lock lock(writer_mutex_);
    const ListenerSnapshot current = listeners_.load();
    if (std::find(current->begin(), current->end(), listener) != current->end()) {
        return;
    }
    auto next = std::make_shared<ConnectionListenerList>(*current);
    next->push_back(std::move(listener));
    listeners_.store(std::move(next));
}

bool ConnectionEventDispatcher::remove_listener(const ConnectionListenerPtr& listener) {
    std::scoped_lock lock(writer_mutex_);
    const ListenerSnapshot current = listeners_.load();
    auto next = std::make_shared<ConnectionListenerList>(*current);
    const auto erased = std::erase(*next, listener);
    if (erased == 0) {
        return false;
    }
    listeners_.store(std::move(next));
    return true;
}

std::size_t ConnectionEventDispatcher::listener_count() const {
    return listeners_.load()->size();
}

void ConnectionEventDispatcher::dispatch(std::string_view event_name,
                                         const std::function<void(ConnectionListener&)>& invoke) const {
    const ListenerSnapshot snapshot = listeners_.load();
    for (const ConnectionListenerPtr& listener : *snapshot) {
        try {
            invoke(*listener);
        } catch (const std::exception& exc) {
            log_event(*logger_, spdlog::level::err,
                      {{"component", "connection"}, {"event", std::string{event_name}}, {"listener_failure", exc.what()}});
        } catch (...) {
            log_event(*logger_, spdlog::level::err,
                      {{"component", "connection"}, {"event", std::string{event_name}}, {"listener_failure", "unknown exception"}});
        }
    }
}

}  // namespace maritime_relay
