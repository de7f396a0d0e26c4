#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

inline constexpr std::chrono::milliseconds DEFAULT_DISCOVERY_TTL{10000};

// Maps a starting directory to the nearest worker socket at or above it.
// Both hits and misses are remembered for `ttl`. Expired entries are dropped
// whenever a new walk is stored.
class DiscoveryCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit DiscoveryCache(std::chrono::milliseconds ttl = DEFAULT_DISCOVERY_TTL,
                            NowFn now = [] { return Clock::now(); });

    std::optional<std::string> resolve(const std::string& start_dir);

    void clear();
    size_t size() const;
    std::chrono::milliseconds ttl() const { return ttl_; }

    // Uncached walk from `dir` up to the filesystem root.
    static std::optional<std::string> search_upward(const std::filesystem::path& dir);

private:
    struct Entry {
        std::optional<std::string> socket_path;
        Clock::time_point observed_at;
    };

    std::chrono::milliseconds ttl_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};
