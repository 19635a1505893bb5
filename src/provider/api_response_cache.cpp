#include "provider/api_response_cache.hpp"

#include <system_error>
#include <utility>
#include "core/logging/logger.hpp"

namespace budget::provider {

using nlohmann::json;

ApiResponseCache::ApiResponseCache(const std::chrono::milliseconds default_ttl, NowFn now)
    : default_ttl_(default_ttl), now_(std::move(now)) {}

bool ApiResponseCache::acquire(std::unique_lock<std::mutex>& lock) const {
    try {
        lock.lock();
        return true;
    } catch (const std::system_error& e) {
        LOG_WARN(std::string("ApiResponseCache: lock unavailable, bypassing cache: ") + e.what());
        return false;
    }
}

void ApiResponseCache::set(const std::string& key, json value) {
    set_with_ttl(key, std::move(value), default_ttl_);
}

void ApiResponseCache::set_with_ttl(const std::string& key, json value,
                                    const std::chrono::milliseconds ttl) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock)) {
        return;
    }
    entries_[key] = CacheEntry{std::move(value), now_(), ttl};
}

std::optional<json> ApiResponseCache::get(const std::string& key) {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock)) {
        return std::nullopt;
    }
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (it->second.is_expired(now_())) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

std::size_t ApiResponseCache::cleanup_expired() {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock)) {
        return 0;
    }
    const auto now = now_();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.is_expired(now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t ApiResponseCache::size() const {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock)) {
        return 0;
    }
    return entries_.size();
}

void ApiResponseCache::clear() {
    std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
    if (!acquire(lock)) {
        return;
    }
    entries_.clear();
}

}  // namespace budget::provider
