#pragma once

#include "common/protocol.hpp"

#include <atomic>
#include <cstddef>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

inline constexpr size_t MAX_CLIENTS = 10;

// JSON-RPC server on a Unix domain socket. One thread per accepted client,
// at most `max_clients` of them at a time.
class ToolServer {
public:
    explicit ToolServer(ToolRegistry tools,
                        ServerIdentity identity = {.name = "toolsock-server", .version = "1.0.0"},
                        size_t max_clients = MAX_CLIENTS, bool verbose = false);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    // Replaces whatever is at `socket_path`, listens there and starts accepting.
    bool start(const std::string& socket_path);

    // Stops accepting, waits for every live session to end, removes the socket.
    // Safe to call more than once.
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }
    size_t active_sessions() const;
    const std::string& socket_path() const { return socket_path_; }
    const ProtocolEngine& engine() const { return engine_; }

private:
    struct ActiveSession {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void serve_client(int client_fd);
    // Moves finished sessions out of sessions_. Caller holds sessions_mutex_.
    std::list<ActiveSession> take_finished();
    void close_fds();
    void log(const std::string& msg);

    ProtocolEngine engine_;
    size_t max_clients_;
    bool verbose_;

    std::string socket_path_;
    int server_fd_ = -1;
    int wake_fd_ = -1;

    std::atomic<bool> running_{false};
    std::jthread accept_thread_;

    mutable std::mutex sessions_mutex_;
    std::list<ActiveSession> sessions_;
};
