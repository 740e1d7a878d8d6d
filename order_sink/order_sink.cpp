#include "order_sink.H"
#include "common/utils.H"
#include "framing/frame_codec.H"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cstring>
#include <functional>
#include <stdexcept>

namespace tickpipe::sink {

namespace {

constexpr int ACCEPT_POLL_MS = 200;
constexpr int RECV_TIMEOUT_MS = 200;

}

OrderSink::OrderSink(const std::string& host, uint16_t port, std::shared_ptr<spdlog::logger> logger)
    : logger(logger)
{
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address for order sink: " + host);
    }

    listen_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd == -1) {
        throw std::runtime_error("Failed to create socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1
        || bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1
        || listen(listen_fd, 5) == -1) {
        int err = errno;
        close(listen_fd);
        throw std::runtime_error("Failed to listen on " + host + ":" + std::to_string(port) + ": " + strerror(err));
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) == -1) {
        int err = errno;
        close(listen_fd);
        throw std::runtime_error("Failed to read bound address: " + std::string(strerror(err)));
    }
    bound_port = ntohs(addr.sin_port);

    logger->info("Order sink listening on {}:{}", host, bound_port);
}

OrderSink::~OrderSink() {
    for (auto& session : clients) {
        if (session.thread.joinable()) {
            session.thread.join();
        }
    }
    close(listen_fd);
}

void OrderSink::run(const std::atomic<bool>& running) {
    while (running) {
        reap_sessions();

        struct pollfd pfd = {listen_fd, POLLIN, 0};
        int ready = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            logger->error("Failed to poll listener: {}", strerror(errno));
            throw std::runtime_error("Failed to poll listener: " + std::string(strerror(errno)));
        }
        if (ready == 0) {
            continue;
        }

        struct sockaddr_in addr;
        socklen_t addr_len = sizeof(addr);
        int conn_fd = accept(listen_fd, reinterpret_cast<sockaddr*>(&addr), &addr_len);
        if (conn_fd == -1) {
            logger->warn("Failed to accept connection: {}", strerror(errno));
            continue;
        }

        std::string peer = format_peer(addr);
        logger->info("Client connected from {}", peer);
        auto& session = clients.emplace_back();
        session.thread = std::thread(&OrderSink::serve_client, this, conn_fd, peer, std::cref(running), std::ref(session.done));
        sessions = clients.size();
    }

    for (auto& session : clients) {
        session.thread.join();
    }
    clients.clear();
    sessions = 0;
    logger->info("Order sink stopped after {} orders", received_orders().size());
}

void OrderSink::reap_sessions() {
    for (auto it = clients.begin(); it != clients.end();) {
        if (it->done) {
            it->thread.join();
            it = clients.erase(it);
        } else {
            ++it;
        }
    }
    sessions = clients.size();
}

void OrderSink::serve_client(int conn_fd, std::string peer, const std::atomic<bool>& running, std::atomic<bool>& done) {
    struct timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = RECV_TIMEOUT_MS * 1000;
    if (setsockopt(conn_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
        logger->warn("Failed to set receive timeout for {}: {}", peer, strerror(errno));
    }

    framing::FrameReader reader(conn_fd, logger);
    std::string frame;
    bool open = true;
    while (open && running) {
        switch (reader.next(frame)) {
            case framing::READ_STATUS::FRAME:
                handle_frame(frame, peer);
                break;
            case framing::READ_STATUS::TIMEOUT:
                break;
            default:
                open = false;
                break;
        }
    }

    close(conn_fd);
    logger->info("Client {} disconnected", peer);
    done = true;
}

bool OrderSink::handle_frame(const std::string& frame, const std::string& peer) {
    order_intent order;
    try {
        order = nlohmann::json::parse(frame).get<order_intent>();
    } catch (const nlohmann::json::exception& e) {
        ++malformed;
        logger->warn("Received malformed data from {}: '{}' ({})", peer, frame, e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        ++malformed;
        logger->warn("Received malformed data from {}: '{}' ({})", peer, frame, e.what());
        return false;
    }

    logger->info("Received trade from {}: {} {} {} @ {:.2f} ({} -> {}) reason: {}", peer, order.symbol,
        to_string(order.side), order.quantity, order.price, to_string(order.position_before),
        to_string(order.position_after), order.reason);

    std::lock_guard<std::mutex> lock(orders_mutex);
    orders.push_back(std::move(order));
    return true;
}

std::vector<order_intent> OrderSink::received_orders() const {
    std::lock_guard<std::mutex> lock(orders_mutex);
    return orders;
}

} // namespace tickpipe::sink
