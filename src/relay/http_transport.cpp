#include "relay/http_transport.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <cerrno>
#include <cstring>
#include <exception>
#include <format>
#include <iterator>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr int READ_TIMEOUT_S = 30;

HttpTransport::Response make_json_response(http::status status, const json& body, unsigned version) {
    HttpTransport::Response res{status, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(false);
    res.body() = rpc::serialize(body);
    res.prepare_payload();
    return res;
}

} // namespace

HttpTransport::HttpTransport(const ProtocolEngine& engine, bool verbose)
    : engine_(engine), verbose_(verbose), acceptor_(ioc_) {}

HttpTransport::~HttpTransport() {
    stop();
}

bool HttpTransport::start(const std::string& address, uint16_t port) {
    if (running()) {
        std::println(stderr, "http: already listening on port {}", port_);
        return false;
    }

    beast::error_code ec;
    auto addr = net::ip::make_address(address, ec);
    if (ec) {
        std::println(stderr, "http: invalid bind address {}: {}", address, ec.message());
        return false;
    }
    const tcp::endpoint ep{addr, port};

    acceptor_.open(ep.protocol(), ec);
    if (ec) {
        std::println(stderr, "http: acceptor open failed: {}", ec.message());
        return false;
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec) {
        std::println(stderr, "http: bind to {}:{} failed: {}", address, port, ec.message());
        acceptor_.close(ec);
        return false;
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        std::println(stderr, "http: listen failed: {}", ec.message());
        acceptor_.close(ec);
        return false;
    }
    acceptor_.non_blocking(true, ec);
    port_ = acceptor_.local_endpoint(ec).port();

    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd_ < 0) {
        std::println(stderr, "http: eventfd() failed: {}", std::strerror(errno));
        acceptor_.close(ec);
        return false;
    }

    running_.store(true, std::memory_order_release);
    accept_thread_ = std::jthread([this] { accept_loop(); });
    log(std::format("listening on http://{}:{}", address, port_));
    return true;
}

void HttpTransport::stop() {
    bool was_running = running_.exchange(false, std::memory_order_acq_rel);

    if (wake_fd_ >= 0) {
        uint64_t val = 1;
        if (::write(wake_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "http: wakeup write failed: {}", std::strerror(errno));
        }
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    beast::error_code ec;
    if (acceptor_.is_open()) acceptor_.close(ec);
    if (wake_fd_ >= 0) {
        ::close(wake_fd_);
        wake_fd_ = -1;
    }

    std::list<Connection> connections;
    {
        std::lock_guard lock(connections_mutex_);
        connections.swap(connections_);
    }
    for (auto& c : connections) {
        if (c.thread.joinable()) c.thread.join();
    }

    if (was_running) log("stopped");
}

void HttpTransport::accept_loop() {
    pollfd fds[2] = {
        {.fd = acceptor_.native_handle(), .events = POLLIN, .revents = 0},
        {.fd = wake_fd_, .events = POLLIN, .revents = 0},
    };

    while (running()) {
        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "http: poll() failed: {}", std::strerror(errno));
            break;
        }
        if (fds[1].revents != 0 || !running()) break;

        tcp::socket socket{ioc_};
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            if (ec == net::error::would_block || ec == net::error::try_again) continue;
            std::println(stderr, "http: accept error: {}", ec.message());
            continue;
        }

        std::list<Connection> finished;
        std::lock_guard lock(connections_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();) {
            auto next = std::next(it);
            if (it->done->load(std::memory_order_acquire)) {
                finished.splice(finished.end(), connections_, it);
            }
            it = next;
        }

        auto done = std::make_shared<std::atomic<bool>>(false);
        connections_.push_back({
            .thread = std::jthread([this, s = std::move(socket), done]() mutable {
                try {
                    handle_connection(std::move(s));
                } catch (const std::exception& e) {
                    std::println(stderr, "http: connection handler error: {}", e.what());
                }
                done->store(true, std::memory_order_release);
            }),
            .done = done,
        });
    }
}

void HttpTransport::handle_connection(tcp::socket socket) {
    beast::error_code ec;
    socket.non_blocking(false, ec);

    // A client that never finishes its request must not pin the thread forever.
    timeval tv{.tv_sec = READ_TIMEOUT_S, .tv_usec = 0};
    ::setsockopt(socket.native_handle(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    beast::flat_buffer buffer;
    Request req;
    http::read(socket, buffer, req, ec);
    if (ec) {
        log("read error: " + ec.message());
        return;
    }

    auto res = dispatch(req);
    http::write(socket, res, ec);
    if (ec) {
        log("write error: " + ec.message());
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

HttpTransport::Response HttpTransport::dispatch(const Request& req) const {
    const auto version = req.version();

    if (req.method() == http::verb::options) {
        Response res{http::status::ok, version};
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::access_control_allow_methods, "POST, GET, OPTIONS");
        res.set(http::field::access_control_allow_headers, "Content-Type");
        res.keep_alive(false);
        res.prepare_payload();
        return res;
    }

    if (req.method() == http::verb::get && req.target() == "/health") {
        return make_json_response(http::status::ok, {{"status", "ok"}}, version);
    }

    if (req.method() != http::verb::post) {
        return make_json_response(http::status::bad_request,
                                  rpc::make_error(nullptr, rpc::INVALID_REQUEST, "Use POST for JSON-RPC requests"),
                                  version);
    }

    if (req.body().empty()) {
        return make_json_response(http::status::bad_request,
                                  rpc::make_error(nullptr, rpc::INVALID_REQUEST, "Empty request body"), version);
    }

    json request;
    try {
        request = json::parse(req.body());
    } catch (const json::parse_error& e) {
        return make_json_response(http::status::bad_request,
                                  rpc::make_error(nullptr, rpc::PARSE_ERROR, std::string("Parse error: ") + e.what()),
                                  version);
    }

    std::optional<json> response;
    try {
        response = engine_.handle(request);
    } catch (const std::exception& e) {
        return make_json_response(http::status::internal_server_error,
                                  rpc::make_error(nullptr, rpc::INTERNAL_ERROR, std::string("Internal error: ") + e.what()),
                                  version);
    }

    if (!response) {
        Response res{http::status::no_content, version};
        res.set(http::field::access_control_allow_origin, "*");
        res.keep_alive(false);
        return res;
    }
    return make_json_response(http::status::ok, *response, version);
}

void HttpTransport::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[toolsock-relay] http: {}", msg);
    }
}
