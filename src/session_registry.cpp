#include "session_registry.h"
#include "logger.h"

namespace viva {

VoidResult SessionRegistry::add(std::shared_ptr<InterviewSession> session) {
    if (!session) {
        return make_invalid_state_error("cannot register a null session");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = sessions_.emplace(session->id(), session);
    if (!inserted.second) {
        return make_invalid_state_error("session " + session->id() + " already registered");
    }
    LOG_SESSION("registered " + session->id() + " (" + std::to_string(sessions_.size()) + " live)");
    return VoidResult();
}

std::shared_ptr<InterviewSession> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::remove(const std::string& id) {
    std::shared_ptr<InterviewSession> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        removed = std::move(it->second);
        sessions_.erase(it);
    }
    // Released outside the lock: the last reference joins the session thread
    removed.reset();
    return true;
}

size_t SessionRegistry::remove_finished() {
    std::vector<std::shared_ptr<InterviewSession>> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->is_finished()) {
                finished.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return finished.size();
}

void SessionRegistry::abort_all(AbortReason reason, const std::string& detail) {
    std::vector<std::shared_ptr<InterviewSession>> live;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            live.push_back(entry.second);
        }
    }
    for (const auto& session : live) {
        session->abort(reason, detail);
    }
}

std::vector<std::string> SessionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& entry : sessions_) {
        result.push_back(entry.first);
    }
    return result;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace viva
