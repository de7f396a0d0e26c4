#include "server/tool_server.hpp"

#include "common/session.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <format>
#include <iterator>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

ToolServer::ToolServer(ToolRegistry tools, ServerIdentity identity, size_t max_clients, bool verbose)
    : engine_(std::move(tools), std::move(identity)), max_clients_(max_clients), verbose_(verbose) {}

ToolServer::~ToolServer() {
    stop();
}

bool ToolServer::start(const std::string& socket_path) {
    if (running()) {
        std::println(stderr, "server: already running on {}", socket_path_);
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "server: socket path too long: {}", socket_path);
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket (or any other leftover file)
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "server: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "server: bind() failed: {}", std::strerror(errno));
        close_fds();
        return false;
    }
    socket_path_ = socket_path;

    if (::listen(server_fd_, 16) < 0) {
        std::println(stderr, "server: listen() failed: {}", std::strerror(errno));
        close_fds();
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
        return false;
    }

    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "server: eventfd() failed: {}", std::strerror(errno));
        close_fds();
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
        return false;
    }

    running_.store(true, std::memory_order_release);
    accept_thread_ = std::jthread([this] { accept_loop(); });

    log(std::format("listening on {} with {} tools", socket_path_, engine_.tools().size()));
    return true;
}

void ToolServer::stop() {
    bool was_running = running_.exchange(false, std::memory_order_acq_rel);

    // Wake the accept loop
    if (wake_fd_ >= 0) {
        uint64_t val = 1;
        if (::write(wake_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "server: wakeup write failed: {}", std::strerror(errno));
        }
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    close_fds();

    // Sessions end when their clients hang up.
    std::list<ActiveSession> sessions;
    {
        std::lock_guard lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    if (was_running && !sessions.empty()) {
        log(std::format("waiting for {} client(s) to disconnect", sessions.size()));
    }
    for (auto& s : sessions) {
        if (s.thread.joinable()) s.thread.join();
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        if (was_running) log("stopped, removed " + socket_path_);
        socket_path_.clear();
    }
}

size_t ToolServer::active_sessions() const {
    std::lock_guard lock(sessions_mutex_);
    size_t n = 0;
    for (const auto& s : sessions_) {
        if (!s.done->load(std::memory_order_acquire)) ++n;
    }
    return n;
}

void ToolServer::accept_loop() {
    pollfd fds[2] = {
        {.fd = server_fd_, .events = POLLIN, .revents = 0},
        {.fd = wake_fd_, .events = POLLIN, .revents = 0},
    };

    while (running()) {
        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (running()) {
                std::println(stderr, "server: poll() failed: {}", std::strerror(errno));
            }
            break;
        }
        if (fds[1].revents != 0 || !running()) break;

        int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            if (running()) {
                std::println(stderr, "server: accept() failed: {}", std::strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            continue;
        }

        // Declared before the lock so finished threads are joined after it is released.
        std::list<ActiveSession> finished;
        std::unique_lock lock(sessions_mutex_);
        finished = take_finished();

        if (sessions_.size() >= max_clients_) {
            lock.unlock();
            ::close(client_fd);
            log(std::format("rejected client: {} sessions active", max_clients_));
            continue;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        sessions_.push_back({
            .thread = std::jthread([this, client_fd, done] {
                serve_client(client_fd);
                done->store(true, std::memory_order_release);
            }),
            .done = done,
        });
        log(std::format("client connected ({} active)", sessions_.size()));
    }
}

void ToolServer::serve_client(int client_fd) {
    struct FdCloser {
        int fd;
        ~FdCloser() { ::close(fd); }
    } closer{client_fd};

    try {
        Session session(client_fd, client_fd, engine_);
        session.run();
        log(std::format("client disconnected after {} request(s)", session.requests_handled()));
    } catch (const std::exception& e) {
        std::println(stderr, "server: client handler error: {}", e.what());
    }
}

std::list<ToolServer::ActiveSession> ToolServer::take_finished() {
    std::list<ActiveSession> finished;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto next = std::next(it);
        if (it->done->load(std::memory_order_acquire)) {
            finished.splice(finished.end(), sessions_, it);
        }
        it = next;
    }
    return finished;
}

void ToolServer::close_fds() {
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }
}

void ToolServer::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[toolsock-server] {}", msg);
    }
}
