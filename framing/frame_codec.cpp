#include "frame_codec.H"

#include <sys/socket.h>
#include <sys/types.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace tickpipe::framing {

std::string encode(std::string_view payload) {
    std::string frame;
    frame.reserve(payload.size() + 1);
    frame.append(payload.data(), payload.size());
    frame.push_back(FRAME_DELIMITER);
    return frame;
}

std::vector<std::string> split_records(std::string_view frame) {
    std::vector<std::string> records;
    size_t start = 0;
    while (start <= frame.size()) {
        size_t end = frame.find(FRAME_DELIMITER, start);
        if (end == std::string_view::npos) {
            end = frame.size();
        }
        if (end > start) {
            records.emplace_back(frame.substr(start, end - start));
        }
        start = end + 1;
    }
    return records;
}

void FrameDecoder::push(const char* data, size_t len) {
    compact();
    buffer.append(data, len);
}

bool FrameDecoder::pop(std::string& frame) {
    size_t pos = buffer.find(FRAME_DELIMITER, std::max(offset, scan_from));
    if (pos == std::string::npos) {
        // nothing before this point can hold a delimiter
        scan_from = buffer.size();
        return false;
    }

    frame.assign(buffer, offset, pos - offset);
    offset = pos + 1;
    scan_from = offset;
    return true;
}

std::string_view FrameDecoder::pending() const {
    return std::string_view(buffer).substr(offset);
}

void FrameDecoder::clear() {
    buffer.clear();
    offset = 0;
    scan_from = 0;
}

void FrameDecoder::compact() {
    if (offset == 0) {
        return;
    }
    buffer.erase(0, offset);
    scan_from = scan_from > offset ? scan_from - offset : 0;
    offset = 0;
}

FrameReader::FrameReader(int sock_fd, std::shared_ptr<spdlog::logger> logger, size_t chunk_size)
    : sock_fd(sock_fd), logger(logger), chunk(chunk_size) {}

READ_STATUS FrameReader::next(std::string& frame) {
    while (true) {
        if (decoder.pop(frame)) {
            return READ_STATUS::FRAME;
        }

        if (done) {
            return READ_STATUS::CLOSED;
        }

        ssize_t len = recv(sock_fd, chunk.data(), chunk.size(), 0);
        if (len > 0) {
            decoder.push(chunk.data(), static_cast<size_t>(len));
            continue;
        }

        if (len == 0) {
            done = true;
            if (decoder.buffered() > 0) {
                logger->warn("Incomplete frame in buffer (socket {} closed): '{}'", sock_fd, decoder.pending());
                decoder.clear();
                return READ_STATUS::INCOMPLETE;
            }
            return READ_STATUS::CLOSED;
        }

        if (errno == EINTR) {
            continue;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return READ_STATUS::TIMEOUT;
        }

        logger->error("Failed to read from socket {}: {}", sock_fd, strerror(errno));
        done = true;
        decoder.clear();
        return READ_STATUS::ERROR;
    }
}

bool send_all(int sock_fd, const char* data, size_t len) {
    size_t bytes_sent = 0;
    while (bytes_sent < len) {
        ssize_t n = send(sock_fd, data + bytes_sent, len - bytes_sent, MSG_NOSIGNAL);
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                errno = ETIMEDOUT;
            }
            return false;
        }
        bytes_sent += static_cast<size_t>(n);
    }
    return true;
}

bool send_frame(int sock_fd, std::string_view payload) {
    std::string frame = encode(payload);
    return send_all(sock_fd, frame.data(), frame.size());
}

} // namespace tickpipe::framing
