#include "session_state_machine.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

namespace viva {

namespace {

/// Shared with the deadline timer callback, which may outlive a turn.
struct DeadlineSignal {
    std::atomic<bool> fired{false};
    std::mutex mutex;
    CancellationSource turn;
};

} // namespace

class SessionStateMachine::Impl {
public:
    Impl(SessionInfo info, IClock& clock, TimerService& timers,
         const DecisionEngine& engine, const BudgetAllocator& allocator, ISessionSink* sink)
        : clock_(clock), timers_(timers), engine_(engine), allocator_(allocator), sink_(sink),
          signal_(std::make_shared<DeadlineSignal>()) {
        session_.info = std::move(info);
        signal_->turn = session_source_.child();
    }

    ~Impl() {
        if (deadline_timer_ != INVALID_TIMER) {
            timers_.cancel(deadline_timer_);
        }
        CancellationSource turn;
        {
            std::lock_guard<std::mutex> lock(signal_->mutex);
            turn = signal_->turn;
        }
        turn.cancel("session destroyed");
    }

    VoidResult start(QuestionPlan plan, TimePoint deadline) {
        VoidResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (started_ || session_.phase != Phase::Created) {
                return make_invalid_state_error("session " + session_.info.id + " already started");
            }

            auto valid = plan.validate();
            if (valid.is_error()) {
                LOG_ERROR("[Session] " + session_.info.id + " rejected plan: " + valid.error().message);
                return valid;
            }

            session_.plan = std::move(plan);
            session_.started_at = clock_.now();
            session_.deadline = deadline;
            started_ = true;

            auto signal = signal_;
            std::string label = "deadline:" + session_.info.id;
            deadline_timer_ = timers_.schedule_at(deadline, [signal, label]() {
                signal->fired = true;
                CancellationSource turn;
                {
                    std::lock_guard<std::mutex> lock(signal->mutex);
                    turn = signal->turn;
                }
                LOG_TIMER(label + " fired");
                turn.cancel("deadline");
            }, label);

            LOG_SESSION(session_.info.id + " starting: " + std::to_string(session_.plan.size()) +
                        " items, " + utils::format_duration_ms(ms_between(session_.started_at, deadline)) +
                        " until deadline");

            transition(Phase::Greeting, "start");
            new_turn();
            reallocate(Duration(0));
        }
        dispatch();
        return result;
    }

    VoidResult advance() {
        VoidResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result = advance_locked();
        }
        dispatch();
        return result;
    }

    VoidResult on_delivered() {
        VoidResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!started_ || is_terminal(session_.phase)) {
                result = make_invalid_state_error(std::string("on_delivered in ") + phase_name(session_.phase));
            } else if (deadline_due_locked()) {
                handle_deadline(std::nullopt);
            } else if (session_.phase == Phase::Delivering || session_.phase == Phase::FollowingUp) {
                transition(Phase::Listening, "delivered");
            } else {
                result = make_invalid_state_error(std::string("on_delivered in ") + phase_name(session_.phase));
            }
        }
        dispatch();
        return result;
    }

    VoidResult on_transcript(const Transcript& transcript) {
        DecisionInput input;
        CancellationToken token;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!started_ || session_.phase != Phase::Listening) {
                return make_invalid_state_error(std::string("on_transcript in ") + phase_name(session_.phase));
            }
            if (deadline_due_locked()) {
                handle_deadline(transcript);
            } else {
                transition(Phase::Deciding, transcript.is_no_answer() ? "no answer" : "answer");
                captured_answer_ = transcript;
                input = decision_input(transcript);
                token = current_turn_token();
            }
        }

        if (!input.item_id.empty()) {
            DecisionOutcome outcome = engine_.decide(input, token);

            std::lock_guard<std::mutex> lock(mutex_);
            if (session_.phase == Phase::Deciding) {
                apply_decision(outcome);
            }
        }
        dispatch();
        return VoidResult();
    }

    void on_deadline() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handle_deadline(std::nullopt);
        }
        dispatch();
    }

    VoidResult complete() {
        VoidResult result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (session_.phase != Phase::Closing) {
                result = make_invalid_state_error(std::string("complete in ") + phase_name(session_.phase));
            } else {
                finish(Phase::Completed, "complete");
            }
        }
        dispatch();
        return result;
    }

    void abort(AbortReason reason, const std::string& detail) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (is_terminal(session_.phase)) {
                return;
            }
            if (session_.phase == Phase::Deciding && captured_answer_) {
                append_exchange(*captured_answer_, ForceAdvance{}, -1.0f, false, false);
            }
            captured_answer_.reset();
            finish_active("aborted");
            session_.abort_reason = reason;
            session_.abort_detail = detail;
            LOG_WARN("[Session] " + session_.info.id + " aborted: " + abort_reason_name(reason) +
                     (detail.empty() ? "" : " (" + detail + ")"));
            session_source_.cancel(std::string("aborted: ") + abort_reason_name(reason));
            finish(Phase::Aborted, abort_reason_name(reason));
        }
        dispatch();
    }

    void record_interruption(const std::string& kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        Interruption interruption;
        interruption.kind = kind;
        interruption.offset = started_ ? offset_of(clock_.now()) : Duration(0);
        interruption.item_id = session_.active_item_id;
        session_.interruptions.push_back(interruption);
        LOG_SESSION(session_.info.id + " interruption: " + kind);
    }

    Phase phase() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_.phase;
    }

    bool deadline_due() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return deadline_due_locked();
    }

    std::string current_prompt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.phase == Phase::Delivering || session_.phase == Phase::FollowingUp) {
            return round_prompt_;
        }
        return "";
    }

    std::optional<PlanItem> active_item() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const PlanItem* item = session_.plan.active();
        if (!item) return std::nullopt;
        return *item;
    }

    Duration item_remaining() const {
        std::lock_guard<std::mutex> lock(mutex_);
        const PlanItem* item = session_.plan.active();
        if (!item || !started_) return Duration(0);
        TimePoint now = clock_.now();
        Duration spent = item->time_spent;
        if (session_.phase == Phase::Delivering || session_.phase == Phase::FollowingUp ||
            session_.phase == Phase::Listening || session_.phase == Phase::Deciding) {
            spent += std::max(Duration(0), std::chrono::duration_cast<Duration>(now - round_start_));
        }
        Duration by_item = item->max_time - spent;
        Duration by_deadline = session_.deadline > now
            ? std::chrono::duration_cast<Duration>(session_.deadline - now) : Duration(0);
        return std::max(Duration(0), std::min(by_item, by_deadline));
    }

    std::optional<Exchange> last_exchange() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.history.empty()) return std::nullopt;
        return session_.history.back();
    }

    CancellationToken turn_token() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_turn_token();
    }

    CancellationToken session_token() const {
        return session_source_.token();
    }

    Session snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_;
    }

    std::optional<SessionSummary> summary() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return summary_;
    }

private:
    // --- helpers below expect mutex_ held ---

    bool deadline_due_locked() const {
        return started_ && (signal_->fired || clock_.now() >= session_.deadline);
    }

    CancellationToken current_turn_token() const {
        std::lock_guard<std::mutex> lock(signal_->mutex);
        return signal_->turn.token();
    }

    void new_turn() {
        CancellationSource previous;
        {
            std::lock_guard<std::mutex> lock(signal_->mutex);
            previous = signal_->turn;
            signal_->turn = session_source_.child();
            if (signal_->fired) {
                signal_->turn.cancel("deadline");
            }
        }
        previous.cancel("turn finished");
    }

    TimePoint effective_now() const {
        TimePoint now = clock_.now();
        return started_ ? std::min(now, session_.deadline) : now;
    }

    Duration offset_of(TimePoint t) const {
        return std::max(Duration(0), std::chrono::duration_cast<Duration>(t - session_.started_at));
    }

    void transition(Phase to, const std::string& note) {
        TransitionRecord record;
        record.from = session_.phase;
        record.to = to;
        record.offset = started_ ? offset_of(clock_.now()) : Duration(0);
        record.item_id = session_.active_item_id;
        record.note = note;
        session_.transitions.push_back(record);
        session_.phase = to;
        LOG_SESSION(session_.info.id + " " + phase_name(record.from) + " -> " + phase_name(to) +
                    (record.item_id.empty() ? "" : " [" + record.item_id + "]") +
                    (note.empty() ? "" : " (" + note + ")"));
    }

    DecisionInput decision_input(const Transcript& transcript) const {
        DecisionInput input;
        const PlanItem* item = session_.plan.active();
        if (!item) return input;
        TimePoint now = clock_.now();
        input.item_id = item->id;
        input.question = round_prompt_;
        input.transcript = transcript;
        input.type = item->type;
        input.rubric = item->rubric;
        input.item_elapsed = item->time_spent +
            std::max(Duration(0), std::chrono::duration_cast<Duration>(now - round_start_));
        input.item_max = item->max_time;
        input.followups_issued = item->followups_issued;
        input.budget = BudgetAllocator::budget_state(session_.plan, now, session_.deadline);
        return input;
    }

    void apply_decision(const DecisionOutcome& outcome) {
        Transcript answer = captured_answer_ ? *captured_answer_ : Transcript::no_answer();
        captured_answer_.reset();

        if (deadline_due_locked()) {
            handle_deadline(answer);
            return;
        }

        if (!outcome.decision) {
            // Cancelled without a deadline: take the forced path
            append_exchange(answer, ForceAdvance{}, -1.0f, false, true);
            transition(Phase::Advancing, "decision cancelled");
            return;
        }

        const Decision& decision = *outcome.decision;
        append_exchange(answer, decision, outcome.coverage, outcome.scoring_failed, true);

        if (const auto* follow_up = std::get_if<FollowUp>(&decision)) {
            PlanItem* item = session_.plan.active();
            if (item) item->followups_issued++;
            round_prompt_ = follow_up->text;
            round_start_ = clock_.now();
            new_turn();
            transition(Phase::FollowingUp, "follow-up " + std::to_string(item ? item->followups_issued : 0));
        } else {
            transition(Phase::Advancing, decision_name(decision));
        }
    }

    void append_exchange(const Transcript& answer, const Decision& decision, float coverage,
                         bool scoring_failed, bool recompute) {
        PlanItem* item = session_.plan.active();
        if (!item) return;

        TimePoint at = effective_now();
        Exchange exchange;
        exchange.item_id = item->id;
        exchange.question = round_prompt_;
        exchange.answer = answer;
        exchange.decision = decision;
        exchange.elapsed = std::max(Duration(0), std::chrono::duration_cast<Duration>(at - round_start_));
        exchange.offset = offset_of(at);
        exchange.round = item->followups_issued;
        exchange.coverage = coverage;
        exchange.scoring_failed = scoring_failed;

        item->time_spent += exchange.elapsed;
        session_.history.push_back(exchange);
        outbox_.push_back(exchange);

        LOG_TRACE(session_.info.id, "exchange",
                  "item=" + exchange.item_id + " decision=" + decision_name(decision) +
                  " elapsed_ms=" + std::to_string(exchange.elapsed.count()) +
                  (scoring_failed ? " scoring_failed=1" : ""));

        if (recompute) {
            // An item that is moving on no longer reserves its minimum
            Duration active_elapsed = is_follow_up(decision) ? item->time_spent : item->max_time;
            reallocate(active_elapsed);
        }
    }

    void reallocate(Duration active_elapsed) {
        AllocationResult allocation = allocator_.apply(session_.plan, active_elapsed,
                                                       clock_.now(), session_.deadline);
        session_.budget = allocation.budget;
        if (allocation.budget_exhausted) {
            std::string ids;
            for (const auto& id : allocation.skipped) {
                ids += (ids.empty() ? "" : ", ") + id;
            }
            session_.warnings.push_back(std::string(error_type_name(ErrorType::BudgetExhausted)) +
                                        ": skipped " + ids);
        }
    }

    bool item_has_answer(const std::string& item_id) const {
        return std::any_of(session_.history.begin(), session_.history.end(), [&item_id](const Exchange& e) {
            return e.item_id == item_id && !e.answer.is_no_answer();
        });
    }

    void finish_active(const std::string& skip_reason) {
        PlanItem* item = session_.plan.active();
        if (!item) return;
        bool answered = item_has_answer(item->id);
        auto finished = session_.plan.finish_active(answered ? ItemStatus::Answered : ItemStatus::Skipped,
                                                    answered ? "" : skip_reason);
        if (finished.is_error()) {
            LOG_WARN("[Session] " + finished.error().to_string());
        }
        session_.active_item_id.clear();
    }

    void pull_next(const std::string& note) {
        PlanItem* next = session_.plan.activate_next();
        if (!next) {
            transition(Phase::Closing, "plan exhausted");
            return;
        }
        session_.active_item_id = next->id;
        round_prompt_ = next->text;
        round_start_ = clock_.now();
        new_turn();
        transition(Phase::Delivering, note);
    }

    VoidResult advance_locked() {
        if (!started_ && session_.phase == Phase::Created) {
            return make_invalid_state_error("advance before start");
        }
        if (is_terminal(session_.phase)) {
            return make_invalid_state_error(std::string("advance in ") + phase_name(session_.phase));
        }
        if (session_.phase != Phase::Closing && deadline_due_locked()) {
            handle_deadline(std::nullopt);
            return VoidResult();
        }

        switch (session_.phase) {
            case Phase::Greeting:
                pull_next("first item");
                break;
            case Phase::Delivering:
                finish_active("advanced before delivery");
                pull_next("advance");
                break;
            case Phase::Listening:
                append_exchange(Transcript::no_answer(), ForceAdvance{}, -1.0f, false, true);
                finish_active("no answer");
                pull_next("advance");
                break;
            case Phase::Deciding: {
                Transcript answer = captured_answer_ ? *captured_answer_ : Transcript::no_answer();
                captured_answer_.reset();
                append_exchange(answer, ForceAdvance{}, -1.0f, false, true);
                finish_active("no answer");
                pull_next("advance");
                break;
            }
            case Phase::FollowingUp:
            case Phase::Advancing:
                finish_active("no answer");
                pull_next("next item");
                break;
            case Phase::Closing:
                finish(Phase::Completed, "complete");
                break;
            case Phase::Created:
            case Phase::Completed:
            case Phase::Aborted:
                return make_invalid_state_error(std::string("advance in ") + phase_name(session_.phase));
        }
        return VoidResult();
    }

    void handle_deadline(const std::optional<Transcript>& answer) {
        if (is_terminal(session_.phase) || session_.phase == Phase::Closing) {
            return;
        }

        session_.deadline_reached = true;
        signal_->fired = true;
        if (deadline_timer_ != INVALID_TIMER) {
            timers_.cancel(deadline_timer_);
            deadline_timer_ = INVALID_TIMER;
        }

        switch (session_.phase) {
            case Phase::Listening:
                append_exchange(answer ? *answer : Transcript::no_answer(), ForceAdvance{}, -1.0f, false, false);
                break;
            case Phase::Deciding: {
                Transcript captured = answer ? *answer
                    : (captured_answer_ ? *captured_answer_ : Transcript::no_answer());
                append_exchange(captured, ForceAdvance{}, -1.0f, false, false);
                break;
            }
            default:
                break;
        }
        captured_answer_.reset();
        finish_active("deadline");

        std::vector<std::string> pending_ids;
        for (const PlanItem* item : session_.plan.pending()) {
            pending_ids.push_back(item->id);
        }
        for (const auto& id : pending_ids) {
            auto skipped = session_.plan.skip(id, "deadline");
            if (skipped.is_error()) {
                LOG_WARN("[Session] " + skipped.error().to_string());
            }
        }

        if (started_) {
            session_.budget = BudgetAllocator::budget_state(session_.plan, clock_.now(), session_.deadline);
        }
        session_.warnings.push_back(std::string(error_type_name(ErrorType::DeadlineExceeded)) +
                                    (pending_ids.empty() ? "" : ": skipped " + std::to_string(pending_ids.size()) + " item(s)"));
        new_turn();
        transition(Phase::Closing, "deadline");
    }

    void finish(Phase terminal, const std::string& note) {
        if (deadline_timer_ != INVALID_TIMER) {
            timers_.cancel(deadline_timer_);
            deadline_timer_ = INVALID_TIMER;
        }
        transition(terminal, note);
        if (summary_) {
            return;
        }

        SessionSummary summary;
        summary.info = session_.info;
        summary.final_phase = terminal;
        summary.history = session_.history;
        summary.items = session_.plan.items();
        summary.abort_reason = session_.abort_reason;
        summary.abort_detail = session_.abort_detail;
        summary.warnings = session_.warnings;
        summary.interruptions = session_.interruptions;
        summary.total_elapsed = started_ ? offset_of(clock_.now()) : Duration(0);
        summary.deadline_reached = session_.deadline_reached;
        summary_ = summary;
        summary_outbox_ = summary;

        LOG_SESSION(session_.info.id + " finished " + phase_name(terminal) + " after " +
                    utils::format_duration_ms(summary.total_elapsed.count()) + ", " +
                    std::to_string(summary.history.size()) + " exchanges, " +
                    std::to_string(session_.plan.count(ItemStatus::Answered)) + " answered, " +
                    std::to_string(session_.plan.count(ItemStatus::Skipped)) + " skipped");
    }

    // --- sink delivery, outside mutex_ ---

    void dispatch() {
        std::vector<Exchange> exchanges;
        std::optional<SessionSummary> summary;
        SessionInfo info;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            exchanges.swap(outbox_);
            summary.swap(summary_outbox_);
            info = session_.info;
        }
        if (!sink_) return;
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        for (const auto& exchange : exchanges) {
            sink_->on_exchange(info, exchange);
        }
        if (summary) {
            sink_->on_summary(*summary);
        }
    }

    IClock& clock_;
    TimerService& timers_;
    const DecisionEngine& engine_;
    const BudgetAllocator& allocator_;
    ISessionSink* sink_;

    mutable std::mutex mutex_;
    std::mutex dispatch_mutex_;
    Session session_;
    bool started_ = false;
    CancellationSource session_source_;
    std::shared_ptr<DeadlineSignal> signal_;
    TimerId deadline_timer_ = INVALID_TIMER;

    TimePoint round_start_{};
    std::string round_prompt_;
    std::optional<Transcript> captured_answer_;

    std::vector<Exchange> outbox_;
    std::optional<SessionSummary> summary_outbox_;
    std::optional<SessionSummary> summary_;
};

SessionStateMachine::SessionStateMachine(SessionInfo info, IClock& clock, TimerService& timers,
                                         const DecisionEngine& engine, const BudgetAllocator& allocator,
                                         ISessionSink* sink)
    : pimpl_(std::make_unique<Impl>(std::move(info), clock, timers, engine, allocator, sink)) {}

SessionStateMachine::~SessionStateMachine() = default;

VoidResult SessionStateMachine::start(QuestionPlan plan, TimePoint deadline) {
    return pimpl_->start(std::move(plan), deadline);
}

VoidResult SessionStateMachine::advance() { return pimpl_->advance(); }
VoidResult SessionStateMachine::on_delivered() { return pimpl_->on_delivered(); }
VoidResult SessionStateMachine::on_transcript(const Transcript& transcript) { return pimpl_->on_transcript(transcript); }
void SessionStateMachine::on_deadline() { pimpl_->on_deadline(); }
VoidResult SessionStateMachine::complete() { return pimpl_->complete(); }

void SessionStateMachine::abort(AbortReason reason, const std::string& detail) {
    pimpl_->abort(reason, detail);
}

void SessionStateMachine::record_interruption(const std::string& kind) {
    pimpl_->record_interruption(kind);
}

Phase SessionStateMachine::phase() const { return pimpl_->phase(); }
bool SessionStateMachine::is_finished() const { return is_terminal(pimpl_->phase()); }
bool SessionStateMachine::deadline_due() const { return pimpl_->deadline_due(); }
std::string SessionStateMachine::current_prompt() const { return pimpl_->current_prompt(); }
std::optional<PlanItem> SessionStateMachine::active_item() const { return pimpl_->active_item(); }
Duration SessionStateMachine::item_remaining() const { return pimpl_->item_remaining(); }
std::optional<Exchange> SessionStateMachine::last_exchange() const { return pimpl_->last_exchange(); }
CancellationToken SessionStateMachine::turn_token() const { return pimpl_->turn_token(); }
CancellationToken SessionStateMachine::session_token() const { return pimpl_->session_token(); }
Session SessionStateMachine::snapshot() const { return pimpl_->snapshot(); }
std::optional<SessionSummary> SessionStateMachine::summary() const { return pimpl_->summary(); }

} // namespace viva
