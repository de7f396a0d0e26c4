#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Server {
        size_t max_clients = 10;
        std::string usage_file;     // empty: built-in usage text
        uint32_t exec_timeout = 60; // seconds
    } server;

    struct Relay {
        uint32_t socket_timeout = 30; // seconds, per connect and per read
        uint32_t cache_ttl = 10;      // seconds
        std::string transport = "stdio"; // "stdio" or "http"
        uint16_t http_port = 3000;
        std::string http_bind = "127.0.0.1";
    } relay;

    static Config load(const std::string& path);
    static Config load_default();
};
