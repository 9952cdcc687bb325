#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace llmshield {

/**
 * @brief Bounded LRU map with per-entry TTL
 *
 * - get(): absent or expired -> nullopt (expired entries are erased on read);
 *          a hit moves the entry to most-recently-used.
 * - set(): replaces any existing entry (moving it to the front); at capacity
 *          the single least-recently-used entry is evicted first.
 * - prune(): full sweep of expired entries, for periodic maintenance.
 *
 * No background thread: expiry is lazy, so memory is bounded by max_size.
 * All operations take one mutex.
 */
template<typename Value = ScanResult>
class ScanCache {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        size_t max_size = 1000;
        std::chrono::milliseconds ttl{300000};    // 5 minutes
    };

    ScanCache() : ScanCache(Config{}) {}
    explicit ScanCache(const Config& config) : config_(config) {
        config_.max_size = std::max(config_.max_size, size_t{1});
    }

    [[nodiscard]] std::optional<Value> get(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        // TTL check
        if (Clock::now() >= it->second->expires_at) {
            lru_list_.erase(it->second);
            map_.erase(it);
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        // Move to front (most recently used)
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->value;
    }

    void set(const std::string& key, Value value) {
        set(key, std::move(value), config_.ttl);
    }

    void set(const std::string& key, Value value, std::chrono::milliseconds ttl) {
        std::lock_guard lock(mutex_);
        const auto expires_at = Clock::now() + ttl;

        // If key exists, update it
        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->value = std::move(value);
            it->second->expires_at = expires_at;
            lru_list_.splice(lru_list_.begin(), lru_list_, it->second);
            return;
        }

        // Evict LRU if at capacity
        if (map_.size() >= config_.max_size && !lru_list_.empty()) {
            map_.erase(lru_list_.back().key);
            lru_list_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        lru_list_.emplace_front(Entry{key, std::move(value), expires_at});
        map_[key] = lru_list_.begin();
    }

    [[nodiscard]] bool has(const std::string& key) { return get(key).has_value(); }

    bool erase(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) return false;
        lru_list_.erase(it->second);
        map_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        lru_list_.clear();
        map_.clear();
    }

    /// Remove all expired entries. Returns count removed.
    size_t prune() {
        std::lock_guard lock(mutex_);
        const auto now = Clock::now();
        size_t removed = 0;
        for (auto it = lru_list_.begin(); it != lru_list_.end(); ) {
            if (now >= it->expires_at) {
                map_.erase(it->key);
                it = lru_list_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    /// Entry count, possibly including expired entries not yet read or pruned
    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return map_.size();
    }

    [[nodiscard]] size_t max_size() const { return config_.max_size; }

    struct Stats {
        uint64_t hits;
        uint64_t misses;
        uint64_t evictions;
        size_t current_entries;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .hits = hits_.load(std::memory_order_relaxed),
            .misses = misses_.load(std::memory_order_relaxed),
            .evictions = evictions_.load(std::memory_order_relaxed),
            .current_entries = size(),
        };
    }

private:
    struct Entry {
        std::string key;
        Value value;
        Clock::time_point expires_at;
    };

    Config config_;
    mutable std::mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<std::string, typename std::list<Entry>::iterator> map_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace llmshield
