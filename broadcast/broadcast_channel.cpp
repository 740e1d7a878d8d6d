#include "broadcast_channel.H"
#include "common/utils.H"
#include "framing/frame_codec.H"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace tickpipe::hub {

namespace {

// a stuck subscriber is dropped instead of stalling the whole channel
constexpr int SEND_TIMEOUT_MS = 1000;
constexpr int ACCEPT_POLL_MS = 200;

}

BroadcastChannel::BroadcastChannel(std::string name, const std::string& host, uint16_t port, std::shared_ptr<spdlog::logger> logger)
    : channel_name(std::move(name)), logger(logger)
{
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("Invalid listen address for " + channel_name + " channel: " + host);
    }

    listen_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd == -1) {
        throw std::runtime_error("Failed to create socket: " + std::string(strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1) {
        int err = errno;
        close(listen_fd);
        throw std::runtime_error("Failed to set socket options: " + std::string(strerror(err)));
    }

    if (bind(listen_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        int err = errno;
        close(listen_fd);
        throw std::runtime_error("Failed to bind " + channel_name + " channel to " + host + ":"
            + std::to_string(port) + ": " + strerror(err));
    }

    if (listen(listen_fd, 64) == -1) {
        int err = errno;
        close(listen_fd);
        throw std::runtime_error("Failed to listen on socket: " + std::string(strerror(err)));
    }

    socklen_t addr_len = sizeof(addr);
    if (getsockname(listen_fd, reinterpret_cast<sockaddr*>(&addr), &addr_len) == -1) {
        int err = errno;
        close(listen_fd);
        throw std::runtime_error("Failed to read bound address: " + std::string(strerror(err)));
    }
    bound_port = ntohs(addr.sin_port);

    logger->info("{} channel listening on {}:{}", channel_name, host, bound_port);
}

BroadcastChannel::~BroadcastChannel() {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    for (const auto& sub : subscribers) {
        close(sub.fd);
    }
    subscribers.clear();
    close(listen_fd);
}

void BroadcastChannel::accept_loop(const std::atomic<bool>& running) {
    while (running) {
        accept_pending(ACCEPT_POLL_MS);
    }
    logger->info("{} channel acceptor stopped", channel_name);
}

bool BroadcastChannel::accept_pending(int timeout_ms) {
    struct pollfd pfd = {listen_fd, POLLIN, 0};
    int ready = poll(&pfd, 1, timeout_ms);
    if (ready == -1) {
        if (errno == EINTR) {
            return false;
        }
        logger->error("Failed to poll {} listener: {}", channel_name, strerror(errno));
        throw std::runtime_error("Failed to poll listener: " + std::string(strerror(errno)));
    }
    if (ready == 0) {
        return false;
    }

    struct sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    int conn_fd = accept(listen_fd, reinterpret_cast<sockaddr*>(&addr), &addr_len);
    if (conn_fd == -1) {
        // the peer may have gone away between poll and accept
        logger->warn("Failed to accept {} subscriber: {}", channel_name, strerror(errno));
        return false;
    }

    struct timeval tv;
    tv.tv_sec = SEND_TIMEOUT_MS / 1000;
    tv.tv_usec = (SEND_TIMEOUT_MS % 1000) * 1000;
    if (setsockopt(conn_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == -1) {
        logger->warn("Failed to set send timeout for {} subscriber: {}", channel_name, strerror(errno));
    }

    std::string peer = format_peer(addr);
    size_t count;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex);
        subscribers.push_back({conn_fd, peer});
        count = subscribers.size();
    }

    logger->info("{} subscriber connected from {} ({} total)", channel_name, peer, count);
    return true;
}

size_t BroadcastChannel::broadcast(const std::string& wire_bytes) {
    std::vector<subscriber> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex);
        targets = subscribers;
    }

    if (targets.empty()) {
        return 0;
    }

    std::vector<int> failed = find_hung_up(targets);
    size_t delivered = 0;

    for (const auto& sub : targets) {
        if (std::find(failed.begin(), failed.end(), sub.fd) != failed.end()) {
            continue;
        }
        if (!framing::send_all(sub.fd, wire_bytes.data(), wire_bytes.size())) {
            logger->warn("Dropping {} subscriber {}: {}", channel_name, sub.peer, strerror(errno));
            failed.push_back(sub.fd);
            continue;
        }
        ++delivered;
    }

    if (!failed.empty()) {
        remove_subscribers(failed);
    }
    return delivered;
}

size_t BroadcastChannel::subscriber_count() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    return subscribers.size();
}

std::vector<int> BroadcastChannel::find_hung_up(const std::vector<subscriber>& targets) const {
    std::vector<struct pollfd> pfds;
    pfds.reserve(targets.size());
    for (const auto& sub : targets) {
        // POLLHUP and POLLERR are always reported
        pfds.push_back({sub.fd, 0, 0});
    }

    std::vector<int> hung_up;
    if (poll(pfds.data(), pfds.size(), 0) <= 0) {
        return hung_up;
    }

    // a half closed subscriber (POLLRDHUP only) still reads, so it stays
    for (size_t i = 0; i < pfds.size(); i++) {
        if (pfds[i].revents & (POLLHUP | POLLERR | POLLNVAL)) {
            logger->info("{} subscriber {} disconnected", channel_name, targets[i].peer);
            hung_up.push_back(pfds[i].fd);
        }
    }
    return hung_up;
}

void BroadcastChannel::remove_subscribers(const std::vector<int>& fds) {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    auto dead = std::stable_partition(subscribers.begin(), subscribers.end(), [&](const subscriber& sub) {
        return std::find(fds.begin(), fds.end(), sub.fd) == fds.end();
    });
    for (auto it = dead; it != subscribers.end(); ++it) {
        close(it->fd);
    }
    subscribers.erase(dead, subscribers.end());
}

} // namespace tickpipe::hub
