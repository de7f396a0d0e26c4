#include "relay/forwarder.hpp"

#include "common/liveness.hpp"
#include "common/protocol.hpp"
#include "relay/timeout.hpp"
#include "relay/unix_socket_client.hpp"

#include <format>
#include <memory>
#include <print>

using json = nlohmann::json;

namespace {

constexpr const char* SERVER_LABEL = "toolsock server";

std::string start_hint(const std::string& dir) {
    return std::format("Start one with:\n  toolsock-server {}", dir);
}

} // namespace

Forwarder::Forwarder(DiscoveryCache& discovery, std::chrono::milliseconds socket_timeout, bool verbose)
    : discovery_(discovery), socket_timeout_(socket_timeout), verbose_(verbose) {}

std::string Forwarder::call(const std::string& tool_name, const std::string& start_dir,
                            const json& arguments) {
    auto socket_path = discovery_.resolve(start_dir);
    if (!socket_path) {
        return render({RelayErrorKind::Discovery, "no socket found"}, start_dir);
    }

    if (!is_alive(*socket_path)) {
        return render({RelayErrorKind::Liveness, "process dead"}, start_dir);
    }

    log(std::format("forwarding {} to {}", tool_name, *socket_path));
    auto result = forward(*socket_path, tool_name, arguments);
    if (!result) {
        log(std::format("{} failed: {}", tool_name, result.error().message));
        return render(result.error(), start_dir);
    }
    return *result;
}

std::expected<std::string, RelayError> Forwarder::forward(const std::string& socket_path,
                                                          const std::string& tool_name,
                                                          const json& arguments) {
    // Shared with the timed steps: an abandoned step keeps the socket open until
    // it finishes, and the last owner closes it.
    auto client = std::make_shared<UnixSocketClient>();

    auto connected = run_with_timeout<void>(
        [client, socket_path](std::stop_token) -> std::expected<void, RelayError> {
            if (auto r = client->connect(socket_path); !r) {
                return std::unexpected(RelayError{RelayErrorKind::Transport, r.error()});
            }
            return {};
        },
        socket_timeout_);
    if (!connected) {
        auto err = connected.error();
        if (err.kind == RelayErrorKind::Timeout) {
            err.message = std::format("{} connecting to {}", err.message, socket_path);
        }
        // Connect failures are reported as socket errors whatever their cause.
        return std::unexpected(RelayError{RelayErrorKind::Transport, "socket error: " + err.message});
    }

    json request = {
        {"jsonrpc", "2.0"},
        {"id", next_id_.fetch_add(1, std::memory_order_relaxed)},
        {"method", "tools/call"},
        {"params", {{"name", tool_name}, {"arguments", arguments}}},
    };
    if (!client->send(request)) {
        return std::unexpected(RelayError{RelayErrorKind::Transport, "failed to send request"});
    }

    auto line = run_with_timeout<std::string>(
        [client](std::stop_token stop) -> std::expected<std::string, RelayError> {
            auto l = client->recv_line(stop);
            if (!l) return std::unexpected(RelayError{RelayErrorKind::Transport, l.error()});
            return *l;
        },
        socket_timeout_);
    if (!line) {
        auto err = line.error();
        if (err.kind == RelayErrorKind::Timeout) err.message += " waiting for response";
        return std::unexpected(err);
    }

    json response;
    try {
        response = json::parse(*line);
    } catch (const json::parse_error& e) {
        return std::unexpected(RelayError{RelayErrorKind::Transport,
                                          std::string("invalid response: ") + e.what()});
    }
    return response_text(response);
}

std::string Forwarder::render(const RelayError& err, const std::string& start_dir) const {
    switch (err.kind) {
        case RelayErrorKind::Discovery:
            return std::format("Error: {} not found in {}. {}", SERVER_LABEL, start_dir, start_hint(start_dir));
        case RelayErrorKind::Liveness:
            return std::format("Error: {} not running (socket exists but process dead). {}",
                               SERVER_LABEL, start_hint(start_dir));
        case RelayErrorKind::Transport:
            if (err.message.starts_with("socket error: ")) {
                return std::format("Error: {}. Is the {} running?", err.message, SERVER_LABEL);
            }
            return std::format("Error communicating with {}: {}", SERVER_LABEL, err.message);
        case RelayErrorKind::Timeout:
            return std::format("Error communicating with {}: {}", SERVER_LABEL, err.message);
    }
    return "Error: " + err.message;
}

void Forwarder::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[toolsock-relay] {}", msg);
    }
}

std::string response_text(const json& response) {
    if (!response.is_object()) return rpc::serialize(response);

    if (response.contains("error")) {
        const auto& error = response["error"];
        std::string message = error.is_object() && error.contains("message") && error["message"].is_string()
                                  ? error["message"].get<std::string>()
                                  : rpc::serialize(error);
        return std::format("Error from {}: {}", SERVER_LABEL, message);
    }

    if (!response.contains("result")) return "";
    const auto& result = response["result"];

    if (result.is_object() && result.contains("content")) {
        const auto& content = result["content"];
        if (content.is_array() && !content.empty()) {
            const auto& first = content.front();
            if (first.is_object() && first.contains("text") && first["text"].is_string()) {
                return first["text"].get<std::string>();
            }
            return "";
        }
    }
    return result.is_string() ? result.get<std::string>() : rpc::serialize(result);
}
