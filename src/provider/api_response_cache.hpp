#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace budget::provider {

// In-memory TTL cache for upstream responses, keyed by request path.
// A failure to take the lock is treated as "cache unavailable": reads
// miss and writes are dropped.
class ApiResponseCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFn = std::function<Clock::time_point()>;

    explicit ApiResponseCache(std::chrono::milliseconds default_ttl = std::chrono::minutes(5),
                              NowFn now = Clock::now);

    void set(const std::string& key, nlohmann::json value);
    void set_with_ttl(const std::string& key, nlohmann::json value,
                      std::chrono::milliseconds ttl);

    // Evicts the entry when it is found expired.
    std::optional<nlohmann::json> get(const std::string& key);

    // Returns the number of entries removed.
    std::size_t cleanup_expired();

    std::size_t size() const;
    void clear();

    std::chrono::milliseconds default_ttl() const { return default_ttl_; }

private:
    struct CacheEntry {
        nlohmann::json value;
        Clock::time_point created_at;
        std::chrono::milliseconds ttl;

        bool is_expired(Clock::time_point now) const { return now - created_at > ttl; }
    };

    bool acquire(std::unique_lock<std::mutex>& lock) const;

    std::chrono::milliseconds default_ttl_;
    NowFn now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> entries_;
};

}  // namespace budget::provider
