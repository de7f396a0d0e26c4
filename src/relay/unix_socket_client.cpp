#include "relay/unix_socket_client.hpp"

#include "common/protocol.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

std::expected<void, std::string> UnixSocketClient::connect(const std::string& socket_path) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        return std::unexpected("socket path too long: " + socket_path);
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
        return std::unexpected(std::string("socket() failed: ") + std::strerror(errno));
    }

    while (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno == EINTR) continue;
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        return std::unexpected(std::string("connect() to ") + socket_path + " failed: " + std::strerror(err));
    }

    reader_.emplace(fd_);
    return {};
}

bool UnixSocketClient::send(const nlohmann::json& msg) {
    if (fd_ < 0) return false;
    return write_line(fd_, rpc::serialize(msg));
}

std::expected<std::string, std::string> UnixSocketClient::recv_line(std::stop_token stop) {
    if (fd_ < 0 || !reader_) return std::unexpected("not connected");

    std::string line;
    switch (reader_->read_line(line, stop)) {
        case ReadStatus::Ok:
            if (line.empty()) return std::unexpected("server closed connection");
            return line;
        case ReadStatus::Eof:
            return std::unexpected("server closed connection");
        case ReadStatus::Stopped:
            return std::unexpected("read cancelled");
        case ReadStatus::Timeout:
            return std::unexpected("read timed out");
        case ReadStatus::Error:
            break;
    }
    return std::unexpected(std::string("read failed: ") + std::strerror(reader_->last_error()));
}

void UnixSocketClient::close() {
    reader_.reset();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
