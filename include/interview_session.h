#pragma once

#include "budget_allocator.h"
#include "candidate_channel.h"
#include "clock.h"
#include "config.h"
#include "decision_engine.h"
#include "errors.h"
#include "session.h"
#include "session_state_machine.h"
#include "speech/speech_io_adapter.h"
#include <memory>
#include <optional>
#include <string>

namespace viva {

/**
 * @brief Collaborators one interview needs
 *
 * Engines are shared (a call abandoned on timeout may still be using them).
 * Clock and timers are owned by the caller and must outlive the session.
 */
struct SessionDependencies {
    IClock* clock = nullptr;
    TimerService* timers = nullptr;
    std::shared_ptr<SpeechIOAdapter> speech;
    CandidateChannelPtr channel;
    AnswerScorerPtr scorer;
    ISessionSink* sink = nullptr;
};

/**
 * @brief Drives one interview on its own thread
 *
 * The loop speaks the greeting, each question and follow-up, opens a
 * listening window, hands answers to the state machine, and closes with the
 * closing statement. Control signals from the channel (pause, resume, abort,
 * end-of-turn) are handled on the channel's thread through the thread-safe
 * entry points below.
 *
 * Pausing holds the loop at the next step boundary; the global deadline
 * keeps running while paused.
 */
class InterviewSession {
public:
    InterviewSession(SessionInfo info, const Config& config, SessionDependencies deps);
    ~InterviewSession();

    InterviewSession(const InterviewSession&) = delete;
    InterviewSession& operator=(const InterviewSession&) = delete;

    /**
     * @brief Start the state machine and launch the session thread
     * @return InvalidPlan if the plan is rejected (no thread is started)
     */
    VoidResult start(QuestionPlan plan);

    /// start() then block until the session is terminal.
    VoidResult run(QuestionPlan plan);

    /// Wait for the session thread to exit.
    void join();

    void pause();
    void resume();
    void abort(AbortReason reason, const std::string& detail = "");
    void end_turn();
    void handle_control(ControlSignal signal);

    const std::string& id() const { return info_.id; }
    Phase phase() const;
    bool is_finished() const;
    bool is_paused() const;
    Session snapshot() const;
    std::optional<SessionSummary> summary() const;

private:
    class Impl;
    SessionInfo info_;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
