#include "relay/discovery.hpp"

#include "common/platform_paths.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace {

fs::path normalize(const std::string& start_dir) {
    std::error_code ec;
    auto p = fs::absolute(start_dir.empty() ? fs::path(".") : fs::path(start_dir), ec);
    if (ec) p = fs::path(start_dir);
    p = p.lexically_normal();
    // "/a/b/" -> "/a/b"
    if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
    return p;
}

} // namespace

DiscoveryCache::DiscoveryCache(std::chrono::milliseconds ttl, NowFn now)
    : ttl_(ttl), now_(std::move(now)) {}

std::optional<std::string> DiscoveryCache::resolve(const std::string& start_dir) {
    auto key = normalize(start_dir).string();

    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && now_() - it->second.observed_at < ttl_) {
            return it->second.socket_path;
        }
    }

    // Walk without the lock; concurrent misses on one key just walk twice.
    auto found = search_upward(key);

    auto now = now_();
    std::lock_guard lock(mutex_);
    std::erase_if(entries_, [&](const auto& item) { return now - item.second.observed_at >= ttl_; });
    entries_[key] = Entry{.socket_path = found, .observed_at = now};
    return found;
}

void DiscoveryCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

size_t DiscoveryCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::optional<std::string> DiscoveryCache::search_upward(const fs::path& dir) {
    fs::path current = dir;
    while (true) {
        auto candidate = current / platform::SOCKET_NAME;
        std::error_code ec;
        if (fs::exists(fs::symlink_status(candidate, ec))) {
            return candidate.string();
        }
        auto parent = current.parent_path();
        if (parent == current || parent.empty()) return std::nullopt;
        current = parent;
    }
}
