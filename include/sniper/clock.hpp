// Sniper Taker Engine - Clocks
// Wall clock for live trading, manual clock for replay and tests

#pragma once

#include <sniper/types.hpp>
#include <atomic>
#include <chrono>
#include <thread>

namespace sniper {

class Clock {
public:
    virtual ~Clock() = default;

    // Unix time in milliseconds
    [[nodiscard]] virtual int64_t now() const = 0;

    // Suspend the calling task (confirmation polling)
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] int64_t now() const override { return now_ms(); }

    void sleep_for(std::chrono::milliseconds duration) override {
        std::this_thread::sleep_for(duration);
    }
};

// Time only moves when told to; sleeping advances it instantly
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 0) : now_(start_ms) {}

    [[nodiscard]] int64_t now() const override {
        return now_.load(std::memory_order_acquire);
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        advance(duration.count());
    }

    void advance(int64_t ms) noexcept {
        now_.fetch_add(ms, std::memory_order_acq_rel);
    }

    // Never moves backwards
    void set(int64_t ms) noexcept {
        int64_t current = now_.load(std::memory_order_acquire);
        while (ms > current &&
               !now_.compare_exchange_weak(current, ms, std::memory_order_acq_rel)) {
        }
    }

private:
    std::atomic<int64_t> now_;
};

}  // namespace sniper
