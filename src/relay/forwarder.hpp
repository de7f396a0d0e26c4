#pragma once

#include "relay/discovery.hpp"
#include "relay/relay_error.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>
#include <string>

inline constexpr std::chrono::milliseconds DEFAULT_SOCKET_TIMEOUT{30000};

// Finds the worker for a directory and relays one tools/call to it.
// Every failure is returned as text for the caller to read; nothing throws.
class Forwarder {
public:
    explicit Forwarder(DiscoveryCache& discovery,
                       std::chrono::milliseconds socket_timeout = DEFAULT_SOCKET_TIMEOUT,
                       bool verbose = false);

    std::string call(const std::string& tool_name, const std::string& start_dir,
                     const nlohmann::json& arguments);

    std::chrono::milliseconds socket_timeout() const { return socket_timeout_; }

private:
    std::expected<std::string, RelayError> forward(const std::string& socket_path,
                                                   const std::string& tool_name,
                                                   const nlohmann::json& arguments);
    std::string render(const RelayError& err, const std::string& start_dir) const;
    void log(const std::string& msg);

    DiscoveryCache& discovery_;
    std::chrono::milliseconds socket_timeout_;
    bool verbose_;
    std::atomic<int64_t> next_id_{1};
};

// Caller-facing text of a worker's tools/call response.
std::string response_text(const nlohmann::json& response);
