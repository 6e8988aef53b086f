#include <catch2/catch.hpp>

#include <array>
#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging_test_fixture.hpp"
#include "maritime_relay/connection_events.hpp"
#include "maritime_relay/secure_random.hpp"
#include "maritime_relay/target_connection.hpp"

using namespace maritime_relay;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    maritime_relay::test::ensure_logger_initialized();
    return true;
}();

/** @brief Records every event it sees and, optionally, the connectivity observed at that moment. */
class RecordingListener final : public ConnectionListener {
  public:
    explicit RecordingListener(const TargetConnection* connection = nullptr) : connection_(connection) {}

    void connecting(const std::string& endpoint_uri) override { list_events.push_back("connecting:" + endpoint_uri); }

    void connected(const std::string& endpoint_uri, bool resumed_session) override {
        list_events.push_back("connected:" + endpoint_uri + (resumed_session ? ":resumed" : ""));
        record_connectivity();
    }

    void disconnected(CloseCode close_code) override {
        list_events.push_back("disconnected:" + std::string{to_string(close_code)});
        record_connectivity();
    }

    void binary_message_received(std::span<const std::byte> message) override {
        list_events.push_back("binary_received:" + std::to_string(message.size()));
    }

    void text_message_sent(std::string_view message) override { list_events.push_back("text_sent:" + std::string{message}); }

    std::vector<std::string> list_events;
    std::vector<bool> list_connectivity;

  private:
    void record_connectivity() {
        if (connection_ != nullptr) {
            list_connectivity.push_back(connection_->is_connected());
        }
    }

    const TargetConnection* connection_;
};

class ThrowingListener final : public ConnectionListener {
  public:
    void connected(const std::string&, bool) override { throw std::runtime_error("listener failure"); }
    void disconnected(CloseCode) override { throw 42; }
    void text_message_received(std::string_view) override { throw std::logic_error("text failure"); }
};

}  // namespace

TEST_CASE("Every listener receives each event despite a failing peer") {
    auto first = std::make_shared<RecordingListener>();
    auto failing = std::make_shared<ThrowingListener>();
    auto last = std::make_shared<RecordingListener>();
    ConnectionEventDispatcher dispatcher{{first, failing, last}, nullptr};

    REQUIRE_NOTHROW(dispatcher.connecting("wss://relay"));
    REQUIRE_NOTHROW(dispatcher.connected("wss://relay", true));
    REQUIRE_NOTHROW(dispatcher.text_message_received("hello"));
    REQUIRE_NOTHROW(dispatcher.disconnected(CloseCode::Timeout));

    const std::vector<std::string> expected{"connecting:wss://relay", "connected:wss://relay:resumed", "disconnected:timeout"};
    REQUIRE(first->list_events == expected);
    REQUIRE(last->list_events == expected);
}

TEST_CASE("Traffic events reach listeners unchanged") {
    auto listener = std::make_shared<RecordingListener>();
    ConnectionEventDispatcher dispatcher{{listener}, nullptr};

    const std::array<std::byte, 3> payload{std::byte{1}, std::byte{2}, std::byte{3}};
    dispatcher.binary_message_received(payload);
    dispatcher.binary_message_sent(payload);
    dispatcher.text_message_sent("ack");

    REQUIRE(listener->list_events == std::vector<std::string>{"binary_received:3", "text_sent:ack"});
}

TEST_CASE("Connectivity callback runs once before listeners") {
    std::vector<std::string> list_calls;
    auto listener = std::make_shared<RecordingListener>();
    ConnectionEventDispatcher dispatcher{{listener}, [&list_calls, &listener](bool connected) {
        list_calls.push_back(connected ? "up" : "down");
        REQUIRE(listener->list_events.size() == list_calls.size());
    }};

    dispatcher.connecting("uri");
    REQUIRE(list_calls.empty());
    dispatcher.connected("uri", false);
    dispatcher.disconnected(CloseCode::Normal);
    REQUIRE(list_calls == std::vector<std::string>{"up", "down"});
}

TEST_CASE("Listener set changes publish a new snapshot") {
    auto first = std::make_shared<RecordingListener>();
    auto second = std::make_shared<RecordingListener>();
    ConnectionEventDispatcher dispatcher{{first}, nullptr};

    dispatcher.add_listener(second);
    dispatcher.add_listener(second);
    REQUIRE(dispatcher.listener_count() == 2);

    dispatcher.connecting("a");
    REQUIRE(dispatcher.remove_listener(first));
    REQUIRE_FALSE(dispatcher.remove_listener(first));
    dispatcher.connecting("b");

    REQUIRE(first->list_events == std::vector<std::string>{"connecting:a"});
    REQUIRE(second->list_events == std::vector<std::string>{"connecting:a", "connecting:b"});
    REQUIRE_THROWS_AS(dispatcher.add_listener(nullptr), std::invalid_argument);
}

TEST_CASE("Null listeners are rejected at construction") {
    REQUIRE_THROWS_AS(ConnectionEventDispatcher({nullptr}, nullptr), std::invalid_argument);
}

TEST_CASE("Target connection updates the registry before listeners run") {
    TargetRegistry registry{};
    const Id160 target_id = SecureRandom::current().next_id160();
    TargetConnection connection{target_id, registry};

    auto observer = std::make_shared<RecordingListener>(&connection);
    auto failing = std::make_shared<ThrowingListener>();
    connection.events().add_listener(observer);
    connection.events().add_listener(failing);
    auto trailing = std::make_shared<RecordingListener>(&connection);
    connection.events().add_listener(trailing);

    REQUIRE_FALSE(connection.is_connected());
    connection.events().connected("wss://relay", false);
    REQUIRE(connection.is_connected());
    REQUIRE(registry.find(target_id)->connected);

    connection.events().disconnected(CloseCode::DuplicateConnect);
    REQUIRE_FALSE(connection.is_connected());
    REQUIRE_FALSE(registry.find(target_id)->connected);

    REQUIRE(observer->list_connectivity == std::vector<bool>{true, false});
    REQUIRE(trailing->list_connectivity == std::vector<bool>{true, false});
}

TEST_CASE("Close codes render as stable names") {
    REQUIRE(to_string(CloseCode::Normal) == "normal");
    REQUIRE(to_string(CloseCode::GoingAway) == "going_away");
    REQUIRE(to_string(CloseCode::ProtocolError) == "protocol_error");
    REQUIRE(to_string(CloseCode::DuplicateConnect) == "duplicate_connect");
    REQUIRE(to_string(CloseCode::InternalError) == "internal_error");
}
