#include "utils.H"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <thread>

namespace tickpipe {

    uint64_t nanotime() {
        struct timespec ts;
        clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
        return ts.tv_sec * 1000000000ULL + ts.tv_nsec;
    }

    double epoch_seconds() {
        struct timespec ts;
        clock_gettime(CLOCK_REALTIME, &ts);
        return ts.tv_sec + ts.tv_nsec / 1e9;
    }

    bool sleep_while_running(std::chrono::milliseconds duration, const std::atomic<bool>& running) {
        constexpr std::chrono::milliseconds SLICE{50};
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (running) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                return true;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(remaining, SLICE));
        }
        return false;
    }

    std::string format_peer(const sockaddr_in& addr) {
        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
    }

    int connect_tcp(const std::string& host, uint16_t port) {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
            errno = EINVAL;
            return -1;
        }

        int sock_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (sock_fd == -1) {
            return -1;
        }

        if (connect(sock_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
            int err = errno;
            close(sock_fd);
            errno = err;
            return -1;
        }
        return sock_fd;
    }

} // namespace tickpipe
