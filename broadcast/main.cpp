#include "broadcast_hub.H"
#include "common/config.H"
#include "common/logging.H"

#include <csignal>
#include <iostream>

namespace {

std::atomic<bool> running{true};

void handle_signal(int) {
    running = false;
}

}

int main(int argc, char** argv) {

    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 1;
    }

    auto logger = tickpipe::make_process_logger("broadcast_hub", "logs/HUB");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int rc = 0;
    try {
        auto config = tickpipe::load_config(argc == 2 ? argv[1] : "");
        tickpipe::hub::BroadcastHub hub(config, logger);
        hub.run(running);
    } catch (const std::exception& e) {
        logger->error("Broadcast hub failed: {}", e.what());
        rc = 1;
    }

    spdlog::shutdown();
    return rc;
}
