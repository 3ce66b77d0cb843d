#include "clock.h"
#include "logger.h"
#include <algorithm>
#include <vector>

namespace viva {

TimerService::TimerService(IClock& clock, Duration max_wait)
    : clock_(clock), max_wait_(max_wait), running_(false) {}

TimerService::~TimerService() {
    stop();
}

void TimerService::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    worker_ = std::thread(&TimerService::worker_loop, this);
}

void TimerService::stop() {
    running_ = false;
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

TimerId TimerService::schedule_at(TimePoint when, std::function<void()> callback,
                                  const std::string& label) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        timers_[id] = Timer{when, std::move(callback), label};
    }
    LOG_TIMER("scheduled #" + std::to_string(id) + " " + label + " in " +
              std::to_string(ms_between(clock_.now(), when)) + "ms");
    cv_.notify_all();
    return id;
}

TimerId TimerService::schedule_after(Duration delay, std::function<void()> callback,
                                     const std::string& label) {
    return schedule_at(clock_.now() + delay, std::move(callback), label);
}

bool TimerService::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) {
        return false;
    }
    LOG_TIMER("cancelled #" + std::to_string(id) + " " + it->second.label);
    timers_.erase(it);
    return true;
}

size_t TimerService::poll() {
    std::vector<Timer> due;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_.now();
        for (auto it = timers_.begin(); it != timers_.end();) {
            if (it->second.when <= now) {
                due.push_back(std::move(it->second));
                it = timers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Earliest first so simultaneous timers fire in due order
    std::stable_sort(due.begin(), due.end(),
                     [](const Timer& a, const Timer& b) { return a.when < b.when; });
    for (auto& timer : due) {
        LOG_TIMER("firing " + timer.label);
        if (timer.callback) {
            timer.callback();
        }
    }
    return due.size();
}

size_t TimerService::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void TimerService::worker_loop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            Duration wait = max_wait_;
            if (!timers_.empty()) {
                TimePoint next = timers_.begin()->second.when;
                for (const auto& entry : timers_) {
                    next = std::min(next, entry.second.when);
                }
                auto remaining = std::chrono::duration_cast<Duration>(next - clock_.now());
                wait = std::max(Duration(0), std::min(remaining, max_wait_));
            }
            if (wait.count() > 0) {
                cv_.wait_for(lock, wait);
            }
        }
        if (!running_) {
            break;
        }
        poll();
    }
}

} // namespace viva
