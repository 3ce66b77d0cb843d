#pragma once

#include "errors.h"
#include "interview_session.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace viva {

/**
 * @brief Live sessions by id
 *
 * Sessions are independent and run in parallel; the registry only tracks
 * them. Removing a session drops the registry's reference; the session is
 * destroyed when its last owner lets go.
 */
class SessionRegistry {
public:
    /// InvalidState if the id is already registered.
    VoidResult add(std::shared_ptr<InterviewSession> session);

    std::shared_ptr<InterviewSession> find(const std::string& id) const;

    bool remove(const std::string& id);

    /// Drop every session that reached a terminal phase. @return number removed
    size_t remove_finished();

    /// Abort every live session.
    void abort_all(AbortReason reason, const std::string& detail = "");

    std::vector<std::string> ids() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<InterviewSession>> sessions_;
};

} // namespace viva
