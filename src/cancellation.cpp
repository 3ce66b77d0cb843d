#include "cancellation.h"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <vector>

namespace viva {

struct CancellationToken::State {
    std::mutex mutex;
    std::atomic<bool> cancelled{false};
    std::string reason;
    std::map<CallbackId, std::function<void()>> callbacks;
    std::vector<std::weak_ptr<State>> children;
    CallbackId next_id = 1;

    void cancel(const std::string& why) {
        std::map<CallbackId, std::function<void()>> to_run;
        std::vector<std::weak_ptr<State>> to_cancel;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled) {
                return;
            }
            reason = why;
            cancelled = true;
            to_run.swap(callbacks);
            to_cancel.swap(children);
        }
        for (auto& entry : to_run) {
            if (entry.second) {
                entry.second();
            }
        }
        for (auto& weak_child : to_cancel) {
            if (auto child = weak_child.lock()) {
                child->cancel(why);
            }
        }
    }

    std::shared_ptr<State> add_child() {
        auto child = std::make_shared<State>();
        bool already_cancelled = false;
        std::string why;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled) {
                already_cancelled = true;
                why = reason;
            } else {
                // Drop expired children so long-lived sessions do not accumulate them
                children.erase(std::remove_if(children.begin(), children.end(),
                                              [](const std::weak_ptr<State>& w) { return w.expired(); }),
                               children.end());
                children.push_back(child);
            }
        }
        if (already_cancelled) {
            child->cancel(why);
        }
        return child;
    }
};

CancellationToken::CancellationToken() : state_(nullptr) {}

bool CancellationToken::is_cancelled() const {
    return state_ && state_->cancelled.load();
}

std::string CancellationToken::reason() const {
    if (!state_) return "";
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
}

CancellationToken::CallbackId CancellationToken::on_cancel(std::function<void()> callback) const {
    if (!state_) {
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->cancelled) {
            CallbackId id = state_->next_id++;
            state_->callbacks[id] = std::move(callback);
            return id;
        }
    }
    if (callback) {
        callback();
    }
    return 0;
}

void CancellationToken::remove_callback(CallbackId id) const {
    if (!state_ || id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

CancellationSource CancellationToken::make_child() const {
    if (!state_) {
        return CancellationSource();
    }
    return CancellationSource(state_->add_child());
}

CancellationSource::CancellationSource() : state_(std::make_shared<CancellationToken::State>()) {}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

void CancellationSource::cancel(const std::string& reason) {
    state_->cancel(reason);
}

bool CancellationSource::is_cancelled() const {
    return state_->cancelled.load();
}

CancellationSource CancellationSource::child() const {
    return CancellationSource(state_->add_child());
}

} // namespace viva
