#include "price_relay.H"
#include "common/config.H"
#include "common/logging.H"
#include "price_store/shared_price_table.H"

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

    auto logger = tickpipe::make_process_logger("price_relay", "logs/RELAY");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int rc = 0;
    try {
        auto config = tickpipe::load_config(argc == 2 ? argv[1] : "");

        // the table must exist before any network traffic
        auto table = tickpipe::store::SharedPriceTable::create(config.shm_name, config.symbols, logger);
        tickpipe::store::TableReleaseGuard guard(table);

        tickpipe::relay::PriceRelay relay(table, config.host, config.price_port,
            std::chrono::milliseconds(config.reconnect_interval_ms), logger);
        relay.run(running);
    } catch (const std::exception& e) {
        logger->error("Price relay failed: {}", e.what());
        rc = 1;
    }

    spdlog::shutdown();
    return rc;
}
