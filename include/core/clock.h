/**
 * @file clock.h
 * @brief Time source for ts_init stamping
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace quantgate {

class Clock {
public:
    virtual ~Clock() = default;
    // Nanoseconds since the UNIX epoch
    virtual uint64_t timestamp_ns() const = 0;
};

class LiveClock : public Clock {
public:
    uint64_t timestamp_ns() const override {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }
};

// Manually advanced clock for tests and replay.
class TestClock : public Clock {
public:
    explicit TestClock(uint64_t start_ns = 0) : now_ns_(start_ns) {}

    uint64_t timestamp_ns() const override { return now_ns_.load(std::memory_order_acquire); }
    void set_time(uint64_t ns) { now_ns_.store(ns, std::memory_order_release); }
    void advance(uint64_t ns) { now_ns_.fetch_add(ns, std::memory_order_acq_rel); }

private:
    std::atomic<uint64_t> now_ns_;
};

inline constexpr uint64_t millis_to_nanos(uint64_t ms) { return ms * 1'000'000ULL; }

} // namespace quantgate
