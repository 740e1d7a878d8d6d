#include "strategy_runner.H"
#include "common/utils.H"
#include "framing/frame_codec.H"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstring>
#include <stdexcept>

namespace tickpipe::strategy {

namespace {

constexpr int RECV_TIMEOUT_MS = 200;

}

StrategyRunner::StrategyRunner(DecisionEngine& engine, const store::SharedPriceTable& table, runner_endpoints endpoints,
    std::shared_ptr<spdlog::logger> logger)
    : engine(engine), table(table), endpoints(std::move(endpoints)), logger(logger) {}

StrategyRunner::~StrategyRunner() {
    if (news_fd != -1) {
        close(news_fd);
    }
    if (order_fd != -1) {
        close(order_fd);
    }
}

int StrategyRunner::connect_with_retry(uint16_t port, const char* what, const std::atomic<bool>& running) {
    while (running) {
        int fd = connect_tcp(endpoints.host, port);
        if (fd != -1) {
            logger->info("Connected to {} at {}:{}", what, endpoints.host, port);
            return fd;
        }
        logger->warn("Could not connect to {} at {}:{}: {}. Retrying in {} ms",
            what, endpoints.host, port, strerror(errno), endpoints.retry_interval.count());
        sleep_while_running(endpoints.retry_interval, running);
    }
    return -1;
}

void StrategyRunner::run(const std::atomic<bool>& running) {
    logger->info("Trading {} with {} attached", engine.symbol(), table.name());

    order_fd = connect_with_retry(endpoints.order_port, "order sink", running);

    while (running) {
        news_fd = connect_with_retry(endpoints.news_port, "news feed", running);
        if (news_fd == -1) {
            break;
        }

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = RECV_TIMEOUT_MS * 1000;
        if (setsockopt(news_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
            logger->warn("Failed to set receive timeout: {}", strerror(errno));
        }

        bool lost = consume_news(running);
        close(news_fd);
        news_fd = -1;

        if (lost && running) {
            logger->warn("News feed disconnected. Reconnecting in {} ms", endpoints.retry_interval.count());
            sleep_while_running(endpoints.retry_interval, running);
        }
    }

    logger->info("Strategy stopped in position {} after {} orders", to_string(engine.position()), order_count.load());
}

bool StrategyRunner::consume_news(const std::atomic<bool>& running) {
    framing::FrameReader reader(news_fd, logger);
    std::string frame;
    while (running) {
        switch (reader.next(frame)) {
            case framing::READ_STATUS::FRAME: {
                auto order = engine.on_news(frame, table);
                ++news_count;
                if (order) {
                    send_order(*order);
                    engine.confirm(*order);
                }
                break;
            }
            case framing::READ_STATUS::TIMEOUT:
                break;
            case framing::READ_STATUS::CLOSED:
            case framing::READ_STATUS::INCOMPLETE:
            case framing::READ_STATUS::ERROR:
                return true;
        }
    }
    return false;
}

void StrategyRunner::send_order(const order_intent& order) {
    std::string body = nlohmann::json(order).dump();
    if (!framing::send_frame(order_fd, body)) {
        logger->error("Error sending order {}: {}", body, strerror(errno));
        throw std::runtime_error("Failed to send order: " + std::string(strerror(errno)));
    }
    ++order_count;
    logger->info("Sent order: {}", body);
}

} // namespace tickpipe::strategy
