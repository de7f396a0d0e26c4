#pragma once

#include "server/tool_server.hpp"

#include <expected>
#include <string>

// What a previous worker left behind in a directory.
struct ExistingServer {
    bool running = false;
    int pid = 0;
};

// Looks at `dir`'s pid file. Artifacts of a worker that is gone (no pid file,
// unparsable pid, dead process) are removed; a live worker is left alone.
ExistingServer check_existing_server(const std::string& dir);

bool write_pid_file(const std::string& dir);
void remove_pid_file(const std::string& dir);
void remove_socket_file(const std::string& dir);

// One worker serving one directory: the socket server plus its pid file.
class Worker {
public:
    Worker(std::string dir, ToolRegistry tools, size_t max_clients = MAX_CLIENTS, bool verbose = false);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Refuses to start over a live worker unless `force` is set.
    std::expected<void, std::string> start(bool force = false);
    void stop();

    bool running() const { return server_.running(); }
    const std::string& dir() const { return dir_; }
    const ToolServer& server() const { return server_; }

private:
    void log(const std::string& msg);

    std::string dir_;
    bool verbose_;
    ToolServer server_;
    bool pid_written_ = false;
};
