#include "decision_engine.H"
#include "strategy_runner.H"
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

    auto logger = tickpipe::make_process_logger("decision_engine", "logs/STRATEGY");

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    int rc = 0;
    try {
        auto config = tickpipe::load_config(argc == 2 ? argv[1] : "");

        auto table = tickpipe::store::SharedPriceTable::attach(config.shm_name, logger);

        tickpipe::strategy::strategy_params params{config.short_window, config.long_window,
            config.bullish_threshold, config.bearish_threshold};
        tickpipe::strategy::DecisionEngine engine(config.symbols.front(), params, config.trade_quantity, logger);

        tickpipe::strategy::StrategyRunner runner(engine, table, {config.host, config.news_port, config.order_port,
            std::chrono::milliseconds(config.reconnect_interval_ms)}, logger);
        runner.run(running);
    } catch (const tickpipe::store::segment_not_found& e) {
        logger->error("{}. Is the price relay running?", e.what());
        rc = 1;
    } catch (const std::exception& e) {
        logger->error("Decision engine failed: {}", e.what());
        rc = 1;
    }

    spdlog::shutdown();
    return rc;
}
