// === Connection Events =======================================================
//
// Lifecycle and traffic notifications for a single connection, and the
// dispatcher that multicasts them to the listeners configured for that
// connection. Dispatch is synchronous and sequential on the calling thread.
// A listener that throws is logged and skipped; the remaining listeners still
// receive the event and nothing propagates back to the caller.
//
// The listener collection is an immutable snapshot. The rare add/remove
// publishes a new snapshot atomically, so concurrent dispatches always iterate
// a stable list.

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "maritime_relay/logging.hpp"

namespace maritime_relay {

/** @brief Reason a connection was closed. */
enum class CloseCode {
    Normal,            /**< Orderly shutdown requested by either side. */
    GoingAway,         /**< Peer is shutting down or navigating away. */
    ProtocolError,     /**< Peer violated the wire protocol. */
    DuplicateConnect,  /**< Another connection for the same target replaced this one. */
    Timeout,           /**< No traffic within the keep-alive window. */
    InternalError      /**< Unexpected failure on this side. */
};

[[nodiscard]] std::string_view to_string(CloseCode close_code) noexcept;

/**
 * @brief Observer of one connection's lifecycle and traffic.
 *
 * Every callback defaults to a no-op so listeners override only what they need.
 */
class ConnectionListener {
  public:
    virtual ~ConnectionListener() = default;

    virtual void connecting(const std::string& endpoint_uri);
    virtual void connected(const std::string& endpoint_uri, bool resumed_session);
    virtual void disconnected(CloseCode close_code);
    virtual void binary_message_received(std::span<const std::byte> message);
    virtual void binary_message_sent(std::span<const std::byte> message);
    virtual void text_message_received(std::string_view message);
    virtual void text_message_sent(std::string_view message);
};

using ConnectionListenerPtr = std::shared_ptr<ConnectionListener>;
using ConnectionListenerList = std::vector<ConnectionListenerPtr>;

/** @brief Fans each event out to every configured listener with per-listener fault isolation. */
class ConnectionEventDispatcher final : public ConnectionListener {
  public:
    /** @brief Invoked with the new state before listeners see connected/disconnected. */
    using ConnectivityCallback = std::function<void(bool connected)>;

    /** @throws std::invalid_argument if @p listeners contains a null entry. */
    ConnectionEventDispatcher(ConnectionListenerList listeners, ConnectivityCallback on_connectivity_changed);

    ConnectionEventDispatcher(const ConnectionEventDispatcher&) = delete;
    ConnectionEventDispatcher& operator=(const ConnectionEventDispatcher&) = delete;

    void connecting(const std::string& endpoint_uri) override;
    void connected(const std::string& endpoint_uri, bool resumed_session) override;
    void disconnected(CloseCode close_code) override;
    void binary_message_received(std::span<const std::byte> message) override;
    void binary_message_sent(std::span<const std::byte> message) override;
    void text_message_received(std::string_view message) override;
    void text_message_sent(std::string_view message) override;

    /** @brief Append @p listener; a listener already present is not added twice. */
    void add_listener(ConnectionListenerPtr listener);
    /** @brief Remove @p listener; returns false if it was not registered. */
    bool remove_listener(const ConnectionListenerPtr& listener);
    [[nodiscard]] std::size_t listener_count() const;

  private:
    using ListenerSnapshot = std::shared_ptr<const ConnectionListenerList>;

    void dispatch(std::string_view event_name, const std::function<void(ConnectionListener&)>& invoke) const;

    std::mutex writer_mutex_;  /**< Serializes snapshot replacement. */
    std::atomic<ListenerSnapshot> listeners_;
    ConnectivityCallback on_connectivity_changed_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace maritime_relay
