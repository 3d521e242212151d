/**
 * @file Clock.hpp
 * @brief Time source abstraction for cache expiry
 */

#pragma once

#include <chrono>
#include <memory>
#include <mutex>

namespace locus {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * @brief Clock that only moves when told to; used to test TTL expiry
 */
class ManualClock : public Clock {
public:
    ManualClock() : now_(std::chrono::steady_clock::time_point{}) {}

    time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(duration delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += delta;
    }

private:
    mutable std::mutex mutex_;
    time_point now_;
};

inline std::shared_ptr<Clock> default_clock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace locus
