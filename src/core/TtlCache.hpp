/**
 * @file TtlCache.hpp
 * @brief In-memory key/value cache with per-entry time-to-live
 *
 * Entries are checked for expiry on every read. Writes also sweep out
 * every expired entry once per default TTL interval, so keys that are
 * never read again do not pile up; cleanup_expired() forces a sweep. Writes replace whole values; two racing writers
 * for the same key leave the later value in place. Thread-safe.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Clock.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace locus {

/**
 * @brief Cache statistics for monitoring and debugging
 */
struct CacheStats {
    size_t total_requests = 0;
    size_t cache_hits = 0;
    size_t cache_misses = 0;
    size_t expired_entries = 0;
    size_t entries = 0;

    double hit_rate() const {
        return total_requests > 0 ? static_cast<double>(cache_hits) / total_requests : 0.0;
    }
};

struct CacheConfig {
    std::chrono::milliseconds default_ttl{std::chrono::minutes(5)};
    bool enable_cache = true;
};

template<typename V>
class TtlCache {
public:
    struct Entry {
        std::string key;
        V value;
        Clock::time_point inserted_at;
        Clock::duration ttl;
    };

    explicit TtlCache(const CacheConfig& config = CacheConfig{},
                      std::shared_ptr<Clock> clock = default_clock())
        : config_(config), clock_(clock ? std::move(clock) : default_clock()),
          last_sweep_(clock_->now()) {}

    /**
     * @brief Fetch a live entry; expired entries are evicted and count as misses
     */
    std::optional<V> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.total_requests++;

        if (!config_.enable_cache) {
            stats_.cache_misses++;
            return std::nullopt;
        }

        auto it = entries_.find(key);
        if (it == entries_.end()) {
            stats_.cache_misses++;
            return std::nullopt;
        }

        if (is_expired(it->second)) {
            entries_.erase(it);
            stats_.expired_entries++;
            stats_.cache_misses++;
            return std::nullopt;
        }

        stats_.cache_hits++;
        return it->second.value;
    }

    void put(const std::string& key, V value) {
        put(key, std::move(value), config_.default_ttl);
    }

    void put(const std::string& key, V value, Clock::duration ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enable_cache) {
            return;
        }
        const Clock::time_point now = clock_->now();
        if (now - last_sweep_ >= config_.default_ttl) {
            sweep_expired();
            last_sweep_ = now;
        }
        entries_[key] = Entry{key, std::move(value), now, ttl};
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        return it != entries_.end() && !is_expired(it->second);
    }

    void erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.erase(key);
    }

    /**
     * @brief Remove expired entries
     * @return Number of entries removed
     */
    size_t cleanup_expired() {
        std::lock_guard<std::mutex> lock(mutex_);
        last_sweep_ = clock_->now();
        return sweep_expired();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            result.push_back(key);
        }
        return result;
    }

    CacheStats get_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats stats = stats_;
        stats.entries = entries_.size();
        return stats;
    }

    void set_cache_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.enable_cache = enabled;
    }

    bool is_cache_enabled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_.enable_cache;
    }

private:
    CacheConfig config_;
    std::shared_ptr<Clock> clock_;
    std::unordered_map<std::string, Entry> entries_;
    CacheStats stats_;
    mutable std::mutex mutex_;

    Clock::time_point last_sweep_;

    // Caller holds mutex_
    size_t sweep_expired() {
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_expired(it->second)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        stats_.expired_entries += removed;
        return removed;
    }

    // Caller holds mutex_
    bool is_expired(const Entry& entry) const {
        return clock_->now() - entry.inserted_at >= entry.ttl;
    }
};

} // namespace locus
