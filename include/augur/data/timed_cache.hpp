#pragma once
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace augur::data {

// Key -> (value, stored-at) map where entries older than the TTL read as
// misses and are dropped on lookup. The clock is injectable for tests.
template<typename Key, typename Value>
class TimedCache {
public:
    using Clock = std::chrono::steady_clock;
    using ClockSource = std::function<Clock::time_point()>;

    explicit TimedCache(std::chrono::seconds ttl, ClockSource clock = &Clock::now)
        : ttl_(ttl), clock_(std::move(clock)) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (clock_() - it->second.second >= ttl_) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.first;
    }

    void put(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = std::make_pair(std::move(value), clock_());
    }

    void erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(key);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    // Counts expired entries that have not been looked up since
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::chrono::seconds ttl() const { return ttl_; }

private:
    std::chrono::seconds ttl_;
    ClockSource clock_;
    std::unordered_map<Key, std::pair<Value, Clock::time_point>> entries_;
    mutable std::mutex mutex_;
};

} // namespace augur::data
