#pragma once

#include "budget_allocator.h"
#include "cancellation.h"
#include "clock.h"
#include "decision_engine.h"
#include "errors.h"
#include "session.h"
#include <memory>
#include <optional>
#include <string>

namespace viva {

/**
 * @brief Owner and sole writer of a Session
 *
 * Transitions:
 * - Created -> Greeting (start)
 * - Greeting -> Delivering(item) | Closing (advance)
 * - Delivering(item) -> Listening (on_delivered)
 * - Listening -> Deciding -> FollowingUp(item) | Advancing (on_transcript)
 * - FollowingUp(item) -> Listening (on_delivered)
 * - Advancing -> Delivering(next) | Closing (advance)
 * - Closing -> Completed (complete, or advance)
 * - any non-terminal -> Closing (on_deadline), -> Aborted (abort)
 *
 * Leaving Listening or Deciding appends exactly one Exchange, unless the
 * session is aborted before an answer was captured. Every Exchange goes to
 * the sink and triggers a budget recomputation. The first terminal
 * transition emits the summary; later ones are ignored.
 *
 * The deadline timer only flags the deadline and cancels the turn in flight.
 * The thread driving the session sees it through deadline_due() or through
 * the cancelled call, and the next event it delivers is routed to Closing.
 * The global deadline wins over any per-item limit.
 *
 * Thread Safety: one thread drives the events. abort(), snapshot(),
 * record_interruption() and the query methods may be called from any thread.
 */
class SessionStateMachine {
public:
    SessionStateMachine(SessionInfo info, IClock& clock, TimerService& timers,
                        const DecisionEngine& engine, const BudgetAllocator& allocator,
                        ISessionSink* sink = nullptr);
    ~SessionStateMachine();

    SessionStateMachine(const SessionStateMachine&) = delete;
    SessionStateMachine& operator=(const SessionStateMachine&) = delete;

    /**
     * @brief Validate the plan, arm the deadline and run the first allocation
     * @return InvalidPlan on a bad plan (session stays Created), InvalidState if already started
     */
    VoidResult start(QuestionPlan plan, TimePoint deadline);

    /// Finish the current step and move on (see class comment for per-phase behaviour).
    VoidResult advance();

    /// Question or follow-up has been played.
    VoidResult on_delivered();

    /// Answer for the current round. Runs the decision engine; may block on scoring.
    VoidResult on_transcript(const Transcript& transcript);

    /// Force Closing. Idempotent, valid in every phase.
    void on_deadline();

    /// Closing -> Completed.
    VoidResult complete();

    /// Any non-terminal phase -> Aborted. Idempotent.
    void abort(AbortReason reason, const std::string& detail = "");

    void record_interruption(const std::string& kind);

    Phase phase() const;
    bool is_finished() const;
    bool deadline_due() const;

    /// Text to say in Delivering (question) or FollowingUp (follow-up); empty otherwise.
    std::string current_prompt() const;

    std::optional<PlanItem> active_item() const;

    /// Time the current item may still use: min(max - spent - this round, deadline - now).
    Duration item_remaining() const;

    /// Decision of the latest Exchange, if any.
    std::optional<Exchange> last_exchange() const;

    /// Cancelled by the deadline or abort; renewed at every Delivering/FollowingUp.
    CancellationToken turn_token() const;

    /// Cancelled by abort only.
    CancellationToken session_token() const;

    Session snapshot() const;
    std::optional<SessionSummary> summary() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
