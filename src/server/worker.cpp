#include "server/worker.hpp"

#include "common/liveness.hpp"
#include "common/platform_paths.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <unistd.h>

namespace fs = std::filesystem;

ExistingServer check_existing_server(const std::string& dir) {
    auto record = check_liveness(platform::pid_path(dir));

    switch (record.state) {
        case Liveness::Alive:
            return {.running = true, .pid = record.pid};
        case Liveness::NoRecord:
            // Orphaned socket without an owner
            remove_socket_file(dir);
            break;
        case Liveness::BadRecord:
        case Liveness::Dead:
            remove_pid_file(dir);
            remove_socket_file(dir);
            break;
    }
    return {.running = false, .pid = record.pid};
}

bool write_pid_file(const std::string& dir) {
    auto path = platform::pid_path(dir);
    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        std::println(stderr, "server: could not write {}", path);
        return false;
    }
    f << ::getpid();
    return static_cast<bool>(f.flush());
}

void remove_pid_file(const std::string& dir) {
    std::error_code ec;
    fs::remove(platform::pid_path(dir), ec);
}

void remove_socket_file(const std::string& dir) {
    std::error_code ec;
    fs::remove(platform::socket_path(dir), ec);
}

Worker::Worker(std::string dir, ToolRegistry tools, size_t max_clients, bool verbose)
    : dir_(std::move(dir)), verbose_(verbose),
      server_(std::move(tools), {.name = "toolsock-server", .version = "1.0.0"}, max_clients, verbose) {}

Worker::~Worker() {
    stop();
}

std::expected<void, std::string> Worker::start(bool force) {
    if (server_.running()) {
        return std::unexpected("worker already started on " + server_.socket_path());
    }

    auto existing = check_existing_server(dir_);
    if (existing.running) {
        if (!force) {
            return std::unexpected(std::format(
                "server already running (pid {}). Check {} or use --force to restart.",
                existing.pid, platform::pid_path(dir_)));
        }
        log(std::format("replacing worker with pid {}", existing.pid));
        remove_pid_file(dir_);
        remove_socket_file(dir_);
    }

    if (!server_.start(platform::socket_path(dir_))) {
        return std::unexpected("failed to listen on " + platform::socket_path(dir_));
    }

    // Written only once the socket accepts connections.
    if (!write_pid_file(dir_)) {
        server_.stop();
        return std::unexpected("failed to write " + platform::pid_path(dir_));
    }
    pid_written_ = true;
    return {};
}

void Worker::stop() {
    server_.stop();
    if (pid_written_) {
        remove_pid_file(dir_);
        pid_written_ = false;
        log("worker stopped");
    }
}

void Worker::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[toolsock-server] {}", msg);
    }
}
