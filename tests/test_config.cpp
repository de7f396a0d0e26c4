#include <catch2/catch_test_macros.hpp>

#include "common/config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "toolsock_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (::write(fd, content.data(), content.size()) < 0) std::perror("write");
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.max_clients == 10);
        REQUIRE(cfg.server.usage_file.empty());
        REQUIRE(cfg.server.exec_timeout == 60);
        REQUIRE(cfg.relay.socket_timeout == 30);
        REQUIRE(cfg.relay.cache_ttl == 10);
        REQUIRE(cfg.relay.transport == "stdio");
        REQUIRE(cfg.relay.http_port == 3000);
        REQUIRE(cfg.relay.http_bind == "127.0.0.1");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "server": { "max_clients": 4, "usage_file": "/etc/toolsock/usage.md", "exec_timeout": 5 },
            "relay": {
                "socket_timeout": 12,
                "cache_ttl": 2,
                "transport": "http",
                "http_port": 8081,
                "http_bind": "0.0.0.0"
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.max_clients == 4);
        REQUIRE(cfg.server.usage_file == "/etc/toolsock/usage.md");
        REQUIRE(cfg.server.exec_timeout == 5);
        REQUIRE(cfg.relay.socket_timeout == 12);
        REQUIRE(cfg.relay.cache_ttl == 2);
        REQUIRE(cfg.relay.transport == "http");
        REQUIRE(cfg.relay.http_port == 8081);
        REQUIRE(cfg.relay.http_bind == "0.0.0.0");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "relay": { "socket_timeout": 3 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.relay.socket_timeout == 3);
        // Other fields retain defaults
        REQUIRE(cfg.relay.cache_ttl == 10);
        REQUIRE(cfg.relay.transport == "stdio");
        REQUIRE(cfg.server.max_clients == 10);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.max_clients == 10);
        REQUIRE(cfg.relay.socket_timeout == 30);
    }

    SECTION("LoadWrongType") {
        TmpFile f(R"({ "server": { "max_clients": "many" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.max_clients == 10);
    }

    SECTION("OutOfRangeValuesKeepDefaults") {
        TmpFile f(R"({
            "server": { "max_clients": 0, "exec_timeout": -5 },
            "relay": { "socket_timeout": 0, "cache_ttl": -1, "http_port": 70000, "transport": "http" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.max_clients == 10);
        REQUIRE(cfg.server.exec_timeout == 60);
        REQUIRE(cfg.relay.socket_timeout == 30);
        REQUIRE(cfg.relay.cache_ttl == 10);
        REQUIRE(cfg.relay.http_port == 3000);
        // Valid keys in the same file still apply
        REQUIRE(cfg.relay.transport == "http");
    }

    SECTION("BoundaryValuesAccepted") {
        TmpFile f(R"({ "server": { "max_clients": 1 }, "relay": { "socket_timeout": 1, "cache_ttl": 0 } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.max_clients == 1);
        REQUIRE(cfg.relay.socket_timeout == 1);
        REQUIRE(cfg.relay.cache_ttl == 0);
    }

    SECTION("FractionalValueRejected") {
        TmpFile f(R"({ "relay": { "socket_timeout": 2.5 } })");
        REQUIRE(Config::load(f.path).relay.socket_timeout == 30);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/toolsock_test_nonexistent_config_file.json");
        REQUIRE(cfg.server.max_clients == 10);
        REQUIRE(cfg.relay.transport == "stdio");
    }
}
