#pragma once

#include "common.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace viva {

/**
 * @brief Monotonic time source
 *
 * Everything that measures interview time (deadlines, item elapsed time,
 * exchange timestamps) reads it through this interface so runs can be
 * made deterministic with ManualClock.
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
};

/// Production clock backed by std::chrono::steady_clock.
class MonotonicClock : public IClock {
public:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

/**
 * @brief Clock that only moves when told to
 *
 * Thread-safe: tests advance it from one thread while a session thread reads it.
 */
class ManualClock : public IClock {
public:
    ManualClock() : now_ns_(0) {}
    explicit ManualClock(TimePoint start) : now_ns_(start.time_since_epoch().count()) {}

    TimePoint now() const override {
        return TimePoint(TimePoint::duration(now_ns_.load()));
    }

    void advance(Duration d) {
        now_ns_ += std::chrono::duration_cast<TimePoint::duration>(d).count();
    }

    void set(TimePoint t) {
        now_ns_ = t.time_since_epoch().count();
    }

private:
    std::atomic<TimePoint::duration::rep> now_ns_;
};

using TimerId = uint64_t;
constexpr TimerId INVALID_TIMER = 0;

/**
 * @brief Cancellable deadline timers
 *
 * Timers fire once, on the TimerService worker thread (after start()) or on
 * whichever thread calls poll(). Callbacks run outside the internal lock and
 * may schedule or cancel other timers.
 *
 * With a ManualClock the worker re-checks at least every max_wait, so clock
 * advances are noticed without real-time sleeping until the due time.
 */
class TimerService {
public:
    explicit TimerService(IClock& clock, Duration max_wait = Duration(20));
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    /// Start the background worker that fires timers as they become due.
    void start();

    /// Stop the background worker. Pending timers are kept and can still be polled.
    void stop();

    TimerId schedule_at(TimePoint when, std::function<void()> callback,
                        const std::string& label = "");

    TimerId schedule_after(Duration delay, std::function<void()> callback,
                           const std::string& label = "");

    /// @return true if the timer was pending and is now cancelled
    bool cancel(TimerId id);

    /// Fire every timer due at clock.now(). @return number of timers fired
    size_t poll();

    size_t pending() const;

    IClock& clock() const { return clock_; }

private:
    struct Timer {
        TimePoint when;
        std::function<void()> callback;
        std::string label;
    };

    void worker_loop();

    IClock& clock_;
    Duration max_wait_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
    std::atomic<bool> running_;
    std::thread worker_;
};

} // namespace viva
