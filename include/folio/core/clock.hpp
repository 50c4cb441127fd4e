// include/folio/core/clock.hpp

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include "folio/core/types.hpp"

namespace folio {

/**
 * @brief Time source for cache expiry and quote staleness
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Blocking wait used between provider retries
 */
using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper make_thread_sleeper();

/**
 * @brief Abort flag shared between the caller and a running refresh
 */
class CancellationToken {
public:
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    void reset() noexcept {
        cancelled_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace folio
