#pragma once

#include "cancellation.h"
#include "common.h"
#include "logger.h"
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace viva {

/**
 * @brief How a suspended call ended
 */
enum class CallStatus {
    Completed,  ///< Work returned a value
    TimedOut,   ///< Caller-supplied timeout elapsed first
    Cancelled,  ///< Session token cancelled (deadline or abort) first
    Failed      ///< Work threw
};

inline const char* call_status_name(CallStatus status) {
    switch (status) {
        case CallStatus::Completed: return "completed";
        case CallStatus::TimedOut:  return "timed_out";
        case CallStatus::Cancelled: return "cancelled";
        case CallStatus::Failed:    return "failed";
    }
    return "unknown";
}

template<typename T>
struct CallOutcome {
    CallStatus status = CallStatus::Failed;
    std::optional<T> value;
    std::string error;
    int64_t elapsed_ms = 0;

    bool ok() const { return status == CallStatus::Completed && value.has_value(); }
};

/**
 * @brief Run work on its own thread and wait for the first of: result, timeout, cancellation
 *
 * Every suspend point of a session (synthesis, transcription, scoring) goes
 * through here, so the deadline/abort path is the same for all of them.
 *
 * The work receives a call-local token that is cancelled when the wait ends
 * without a result; engines should poll it and return early. The work thread
 * is detached in that case and its result dropped, so the work must only
 * capture state it co-owns (shared_ptr), never the caller's stack.
 *
 * @param label Name used in logs
 * @param work Function producing the result; may throw
 * @param timeout Maximum wait (0 = no timeout)
 * @param cancel Session/turn token
 */
template<typename T>
CallOutcome<T> run_with_timeout(const std::string& label,
                                std::function<T(const CancellationToken&)> work,
                                Duration timeout,
                                const CancellationToken& cancel) {
    struct Channel {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        bool cancelled = false;
        std::optional<T> value;
        std::string error;
    };

    CallOutcome<T> outcome;
    auto start = std::chrono::steady_clock::now();

    if (cancel.is_cancelled()) {
        outcome.status = CallStatus::Cancelled;
        outcome.error = cancel.reason();
        return outcome;
    }

    auto channel = std::make_shared<Channel>();
    CancellationSource call_source = cancel.make_child();
    CancellationToken call_token = call_source.token();

    std::thread worker([channel, work, call_token]() {
        std::optional<T> result;
        std::string error;
        try {
            result = work(call_token);
        } catch (const std::exception& e) {
            error = e.what();
        } catch (...) {
            error = "unknown exception";
        }
        std::lock_guard<std::mutex> lock(channel->mutex);
        channel->value = std::move(result);
        channel->error = std::move(error);
        channel->done = true;
        channel->cv.notify_all();
    });

    {
        ScopedCancelCallback wake(cancel, [channel]() {
            std::lock_guard<std::mutex> lock(channel->mutex);
            channel->cancelled = true;
            channel->cv.notify_all();
        });

        std::unique_lock<std::mutex> lock(channel->mutex);
        auto ready = [&channel]() { return channel->done || channel->cancelled; };
        bool finished;
        if (timeout.count() > 0) {
            finished = channel->cv.wait_for(lock, timeout, ready);
        } else {
            channel->cv.wait(lock, ready);
            finished = true;
        }

        if (channel->done) {
            if (channel->error.empty() && channel->value.has_value()) {
                outcome.status = CallStatus::Completed;
                outcome.value = std::move(channel->value);
            } else {
                outcome.status = CallStatus::Failed;
                outcome.error = channel->error.empty() ? "no result" : channel->error;
            }
        } else if (channel->cancelled) {
            outcome.status = CallStatus::Cancelled;
            outcome.error = cancel.reason();
        } else if (!finished) {
            outcome.status = CallStatus::TimedOut;
            outcome.error = label + " exceeded " + std::to_string(timeout.count()) + "ms";
        }
    }

    outcome.elapsed_ms = std::chrono::duration_cast<Duration>(
        std::chrono::steady_clock::now() - start).count();

    if (outcome.status == CallStatus::Completed || outcome.status == CallStatus::Failed) {
        worker.join();
    } else {
        call_source.cancel(call_status_name(outcome.status));
        Logger::debug("[Async] " + label + " " + call_status_name(outcome.status) +
                      " after " + std::to_string(outcome.elapsed_ms) + "ms, detaching worker");
        worker.detach();
    }
    return outcome;
}

} // namespace viva
