#include "common/config.hpp"

#include "common/platform_paths.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Integer setting in [min, max of T]. Anything else keeps the default.
template <typename T>
void read_count(const json& section, const char* label, const char* key, int64_t min, T& out) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n >= static_cast<uint64_t>(min) && n <= std::numeric_limits<T>::max()) {
            out = static_cast<T>(n);
            return;
        }
    } else if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n >= min && static_cast<uint64_t>(n) <= std::numeric_limits<T>::max()) {
            out = static_cast<T>(n);
            return;
        }
    }
    std::println(stderr, "config: invalid {}: {}, using {}", label, v.dump(), out);
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            read_count(s, "server.max_clients", "max_clients", 1, cfg.server.max_clients);
            if (s.contains("usage_file")) cfg.server.usage_file = s["usage_file"].get<std::string>();
            read_count(s, "server.exec_timeout", "exec_timeout", 1, cfg.server.exec_timeout);
        }

        if (j.contains("relay")) {
            auto& r = j["relay"];
            read_count(r, "relay.socket_timeout", "socket_timeout", 1, cfg.relay.socket_timeout);
            read_count(r, "relay.cache_ttl", "cache_ttl", 0, cfg.relay.cache_ttl);
            if (r.contains("transport")) cfg.relay.transport = r["transport"].get<std::string>();
            read_count(r, "relay.http_port", "http_port", 0, cfg.relay.http_port);
            if (r.contains("http_bind")) cfg.relay.http_bind = r["http_bind"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
