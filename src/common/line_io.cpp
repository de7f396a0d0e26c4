#include "common/line_io.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr int POLL_SLICE_MS = 50;

bool write_all(int fd, const char* data, size_t size) {
    size_t total = 0;
    bool is_socket = true;
    while (total < size) {
        ssize_t n = is_socket ? ::send(fd, data + total, size - total, MSG_NOSIGNAL)
                              : ::write(fd, data + total, size - total);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == ENOTSOCK && is_socket) {
                is_socket = false;
                continue;
            }
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

bool LineReader::take_line(std::string& line) {
    auto pos = buf_.find('\n');
    if (pos == std::string::npos) return false;

    line.assign(buf_, 0, pos);
    buf_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

ReadStatus LineReader::read_line(std::string& line, std::stop_token stop, int timeout_ms) {
    using clock = std::chrono::steady_clock;
    const bool sliced = stop.stop_possible() || timeout_ms >= 0;
    const auto deadline = clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));

    while (true) {
        if (take_line(line)) return ReadStatus::Ok;

        if (eof_) {
            if (buf_.empty()) return ReadStatus::Eof;
            line = std::move(buf_);
            buf_.clear();
            return ReadStatus::Ok;
        }

        if (stop.stop_requested()) return ReadStatus::Stopped;

        int wait_ms = -1;
        if (sliced) {
            wait_ms = POLL_SLICE_MS;
            if (timeout_ms >= 0) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
                if (left.count() <= 0) return ReadStatus::Timeout;
                wait_ms = std::min<int>(wait_ms, static_cast<int>(left.count()));
            }
        }

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        int ret = ::poll(&pfd, 1, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            last_error_ = errno;
            return ReadStatus::Error;
        }
        if (ret == 0) continue;

        char tmp[4096];
        ssize_t n = ::read(fd_, tmp, sizeof(tmp));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            if (errno == ECONNRESET) {
                eof_ = true;
                continue;
            }
            last_error_ = errno;
            return ReadStatus::Error;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        buf_.append(tmp, static_cast<size_t>(n));
    }
}

bool write_line(int fd, std::string_view line) {
    std::string msg;
    msg.reserve(line.size() + 1);
    msg.append(line);
    msg.push_back('\n');
    return write_all(fd, msg.data(), msg.size());
}
