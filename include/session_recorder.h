#pragma once

#include "config.h"
#include "session.h"
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Session sink that archives the record stream
 *
 * Layout: <session_log_dir>/<session id>/exchanges.jsonl (one Exchange per
 * line, appended as they happen) and summary.json (written once). With a
 * persistence URL set, every record is also POSTed there, fire-and-forget.
 */
class SessionRecorder : public ISessionSink {
public:
    explicit SessionRecorder(const RecorderConfig& config);
    ~SessionRecorder() override;

    void on_exchange(const SessionInfo& info, const Exchange& exchange) override;
    void on_summary(const SessionSummary& summary) override;

    /// Block until outstanding persistence POSTs have finished. Called on destruction.
    void flush();
    size_t pending_posts() const;

    std::string session_path(const std::string& session_id) const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
