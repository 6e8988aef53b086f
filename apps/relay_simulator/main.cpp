#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "maritime_relay/configuration.hpp"
#include "maritime_relay/logging.hpp"
#include "maritime_relay/relay_runtime.hpp"
#include "maritime_relay/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace maritime_relay;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        RelayConfig configuration = ConfigurationLoader::load();
        if (configuration.log_level) {
            set_log_level(*configuration.log_level);
        }
        log_event(*get_logger(), spdlog::level::info,
                  {{"component", "main"}, {"event", "starting"}, {"version", std::string{k_version}}});

        RelayRuntime runtime{configuration};
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            log_event(*logger, spdlog::level::critical, {{"component", "main"}, {"event", "fatal"}, {"error", exc.what()}});
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
