#pragma once

#include "common/protocol.hpp"

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// JSON-RPC over HTTP: one request per connection, one thread per connection.
class HttpTransport {
public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    explicit HttpTransport(const ProtocolEngine& engine, bool verbose = false);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Port 0 picks a free port; see port().
    bool start(const std::string& address, uint16_t port);
    void stop();

    bool running() const { return running_.load(std::memory_order_acquire); }
    uint16_t port() const { return port_; }

    // Maps one HTTP request to its response. No I/O.
    Response dispatch(const Request& req) const;

private:
    struct Connection {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(boost::asio::ip::tcp::socket socket);
    void log(const std::string& msg);

    const ProtocolEngine& engine_;
    bool verbose_;

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    int wake_fd_ = -1;

    std::atomic<bool> running_{false};
    std::jthread accept_thread_;

    std::mutex connections_mutex_;
    std::list<Connection> connections_;
};
