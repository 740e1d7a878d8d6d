#include "broadcast_hub.H"
#include "common/utils.H"
#include "framing/frame_codec.H"

#include <exception>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

namespace tickpipe::hub {

BroadcastHub::BroadcastHub(const pipeline_config& config, std::shared_ptr<spdlog::logger> logger)
    : prices("price", config.host, config.price_port, logger),
      news("news", config.host, config.news_port, logger),
      price_walk(config.symbols, std::random_device()()),
      sentiment(std::random_device()()),
      price_interval_ms(config.price_interval_ms),
      news_interval_ms(config.news_interval_ms),
      logger(logger) {}

size_t BroadcastHub::price_tick() {
    const auto& updates = price_walk.step();
    uint64_t tick_number = ++tick;
    if (t1 == 0) {
        t1 = nanotime();
    }

    if (prices.subscriber_count() == 0) {
        return 0;
    }

    std::string wire;
    for (const auto& update : updates) {
        wire += framing::encode(format_price_record(update));
    }

    size_t delivered = prices.broadcast(wire);

    uint64_t now = nanotime();
    double elapsed = (now - t1) / 1e9;
    double throughput_est = elapsed > 0 ? tick_number / elapsed : 0.0;
    logger->info("tick={} ts={} throughput_est={:.2f} ticks/s subscribers={}", tick_number, now, throughput_est, delivered);
    return delivered;
}

size_t BroadcastHub::news_tick() {
    int value = sentiment.next();
    if (news.subscriber_count() == 0) {
        return 0;
    }

    size_t delivered = news.broadcast(framing::encode(std::to_string(value)));
    logger->info("Sent sentiment {} to {} subscribers", value, delivered);
    return delivered;
}

void BroadcastHub::ticker_loop(const std::atomic<bool>& running, uint32_t interval_ms, size_t (BroadcastHub::*tick_fn)()) {
    while (running) {
        (this->*tick_fn)();
        sleep_while_running(std::chrono::milliseconds(interval_ms), running);
    }
}

void BroadcastHub::run(std::atomic<bool>& running) {
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto guarded = [&](auto body) {
        return [&, body]() {
            try {
                body();
            } catch (const std::exception& e) {
                logger->error("Hub loop failed: {}", e.what());
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) {
                    failure = std::current_exception();
                }
                running = false;
            }
        };
    };

    std::vector<std::thread> threads;
    threads.emplace_back(guarded([&] { prices.accept_loop(running); }));
    threads.emplace_back(guarded([&] { news.accept_loop(running); }));
    threads.emplace_back(guarded([&] { ticker_loop(running, price_interval_ms, &BroadcastHub::price_tick); }));
    threads.emplace_back(guarded([&] { ticker_loop(running, news_interval_ms, &BroadcastHub::news_tick); }));

    logger->info("Broadcast hub running: price port {}, news port {}", prices.port(), news.port());

    for (auto& t : threads) {
        t.join();
    }

    logger->info("Broadcast hub stopped after {} price ticks", tick.load());
    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace tickpipe::hub
