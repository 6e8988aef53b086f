#include <catch2/catch.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include "logging_test_fixture.hpp"
#include "maritime_relay/endpoint_service.hpp"
#include "maritime_relay/target_registry.hpp"

using namespace maritime_relay;

namespace {

/** @brief Attaches a sink with the file sink's pattern to the shared logger for one test. */
class CapturedLog {
  public:
    CapturedLog()
        : logger_((maritime_relay::test::ensure_logger_initialized(), get_logger())),
          sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)),
          previous_level_(logger_->level()) {
        sink_->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","thread":%t,"msg":%v})");
        logger_->sinks().push_back(sink_);
        logger_->set_level(spdlog::level::debug);
    }

    ~CapturedLog() {
        auto& sinks = logger_->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        logger_->set_level(previous_level_);
    }

    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    spdlog::logger& logger() { return *logger_; }

    std::vector<nlohmann::json> lines() {
        logger_->flush();
        std::vector<nlohmann::json> list_lines;
        std::istringstream input{stream_.str()};
        for (std::string line; std::getline(input, line);) {
            list_lines.push_back(nlohmann::json::parse(line));
        }
        return list_lines;
    }

  private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum previous_level_;
};

Id160 make_id(int value) {
    Id160::Bytes bytes{};
    bytes[19] = static_cast<std::uint8_t>(value);
    return Id160{bytes};
}

}  // namespace

TEST_CASE("Logged events stay valid JSON lines", "[logging]") {
    CapturedLog captured;
    const std::string hostile{"quote\" backslash\\ newline\n end"};

    log_event(captured.logger(), spdlog::level::info, {{"component", "tests"}, {"value", hostile}});

    const auto list_lines = captured.lines();
    REQUIRE(list_lines.size() == 1);
    REQUIRE(list_lines[0]["level"] == "info");
    REQUIRE(list_lines[0]["msg"]["component"] == "tests");
    REQUIRE(list_lines[0]["msg"]["value"] == hostile);
}

TEST_CASE("Events below the logger level are dropped", "[logging]") {
    CapturedLog captured;
    captured.logger().set_level(spdlog::level::warn);

    log_event(captured.logger(), spdlog::level::info, {{"component", "tests"}});
    log_event(captured.logger(), spdlog::level::err, {{"component", "tests"}, {"event", "kept"}});

    const auto list_lines = captured.lines();
    REQUIRE(list_lines.size() == 1);
    REQUIRE(list_lines[0]["msg"]["event"] == "kept");
}

TEST_CASE("Endpoint names with quotes are escaped in registration events", "[logging]") {
    CapturedLog captured;
    TargetRegistry registry{2};
    EndpointService service{registry};
    const std::string endpoint_name{R"(ais","admin":true,"x":")"};

    service.register_endpoint(make_id(1), endpoint_name);

    const auto list_lines = captured.lines();
    const auto iterator_register = std::find_if(list_lines.begin(), list_lines.end(), [](const nlohmann::json& line) {
        return line["msg"].value("event", "") == "register";
    });
    REQUIRE(iterator_register != list_lines.end());
    const nlohmann::json& event = (*iterator_register)["msg"];
    REQUIRE(event["endpoint"] == endpoint_name);
    REQUIRE(event["changed"] == true);
    REQUIRE_FALSE(event.contains("admin"));
}

TEST_CASE("Unknown log levels are reported and fall back to info", "[logging]") {
    CapturedLog captured;

    set_log_level("loud");

    const auto list_lines = captured.lines();
    REQUIRE(list_lines.size() == 1);
    REQUIRE(list_lines[0]["msg"]["event"] == "unknown_level");
    REQUIRE(list_lines[0]["msg"]["level"] == "loud");
    REQUIRE(captured.logger().level() == spdlog::level::info);
}
