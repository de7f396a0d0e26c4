#pragma once

#include "common/line_io.hpp"

#include <expected>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>

class UnixSocketClient {
public:
    UnixSocketClient();
    ~UnixSocketClient();

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    std::expected<void, std::string> connect(const std::string& socket_path);
    bool send(const nlohmann::json& msg);

    // One response line. Waits until a line arrives, the peer closes, or `stop` fires.
    std::expected<std::string, std::string> recv_line(std::stop_token stop = {});

    void close();
    bool is_open() const { return fd_ >= 0; }

private:
    int fd_ = -1;
    std::optional<LineReader> reader_;
};
