#include "price_relay.H"
#include "common/utils.H"
#include "framing/frame_codec.H"

#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace tickpipe::relay {

namespace {

// bounds how long a blocked read goes without checking the run flag
constexpr int RECV_TIMEOUT_MS = 200;

}

std::optional<price_update> parse_price_record(std::string_view record) {
    size_t comma = record.find(',');
    if (comma == std::string_view::npos || comma == 0 || record.find(',', comma + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    std::string price_text(record.substr(comma + 1));
    if (price_text.empty() || std::isspace(static_cast<unsigned char>(price_text.front()))) {
        return std::nullopt;
    }

    char* end = nullptr;
    errno = 0;
    double price = std::strtod(price_text.c_str(), &end);
    if (errno != 0 || end != price_text.c_str() + price_text.size() || !std::isfinite(price)) {
        return std::nullopt;
    }

    return price_update{std::string(record.substr(0, comma)), price};
}

PriceRelay::PriceRelay(store::SharedPriceTable& table, std::string host, uint16_t port,
    std::chrono::milliseconds retry_interval, std::shared_ptr<spdlog::logger> logger)
    : table(table), host(std::move(host)), port(port), retry_interval(retry_interval), logger(logger) {}

size_t PriceRelay::apply_frame(std::string_view frame) {
    size_t applied = 0;
    for (const auto& record : framing::split_records(frame)) {
        auto update = parse_price_record(record);
        if (!update) {
            logger->warn("Skipping malformed price record '{}' in frame '{}'", record, frame);
            continue;
        }
        if (table.update(update->symbol, update->price)) {
            ++applied;
            logger->debug("Updated {} -> {:.2f}", update->symbol, update->price);
        }
    }
    updates += applied;
    return applied;
}

void PriceRelay::run(const std::atomic<bool>& running) {
    while (running) {
        int sock_fd = connect_tcp(host, port);
        if (sock_fd == -1) {
            logger->warn("Price channel {}:{} unavailable: {}. Retrying in {} ms",
                host, port, strerror(errno), retry_interval.count());
            sleep_while_running(retry_interval, running);
            continue;
        }

        ++connections;
        logger->info("Connected to price channel {}:{}", host, port);

        consume(sock_fd, running);
        close(sock_fd);

        if (running) {
            logger->warn("Price channel {}:{} disconnected. Reconnecting in {} ms", host, port, retry_interval.count());
            sleep_while_running(retry_interval, running);
        }
    }
    logger->info("Price relay stopped after {} updates", updates.load());
}

void PriceRelay::consume(int sock_fd, const std::atomic<bool>& running) {
    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = RECV_TIMEOUT_MS * 1000;
    if (setsockopt(sock_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
        logger->warn("Failed to set receive timeout: {}", strerror(errno));
    }

    framing::FrameReader reader(sock_fd, logger);
    std::string frame;
    while (running) {
        switch (reader.next(frame)) {
            case framing::READ_STATUS::FRAME:
                apply_frame(frame);
                break;
            case framing::READ_STATUS::TIMEOUT:
                break;
            case framing::READ_STATUS::CLOSED:
            case framing::READ_STATUS::INCOMPLETE:
            case framing::READ_STATUS::ERROR:
                return;
        }
    }
}

} // namespace tickpipe::relay
