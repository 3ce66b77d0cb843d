#include "interview_session.h"
#include "logger.h"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace viva {

class InterviewSession::Impl {
public:
    Impl(const SessionInfo& info, const Config& config, SessionDependencies deps)
        : session_id_(info.id),
          config_(config),
          deps_(std::move(deps)),
          engine_(config.decision, deps_.scorer, Duration(config.timeouts.scoring_ms)),
          sm_(info, *deps_.clock, *deps_.timers, engine_, allocator_, deps_.sink),
          paused_(false) {}

    ~Impl() {
        if (deps_.channel) {
            deps_.channel->set_control_handler(nullptr);
        }
        if (thread_.joinable()) {
            if (!sm_.is_finished()) {
                abort(AbortReason::Shutdown, "session destroyed");
            }
            thread_.join();
        }
    }

    VoidResult start(QuestionPlan plan) {
        if (thread_.joinable()) {
            return make_invalid_state_error("session already running");
        }
        auto started = sm_.start(std::move(plan), deps_.clock->now() + config_.deadline());
        if (started.is_error()) {
            return started;
        }
        deps_.channel->set_control_handler([this](ControlSignal signal) { handle_control(signal); });
        thread_ = std::thread(&Impl::loop, this);
        return VoidResult();
    }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void pause() {
        {
            std::lock_guard<std::mutex> lock(pause_mutex_);
            if (paused_) return;
            paused_ = true;
        }
        sm_.record_interruption("pause");
    }

    void resume() {
        {
            std::lock_guard<std::mutex> lock(pause_mutex_);
            if (!paused_) return;
            paused_ = false;
        }
        pause_cv_.notify_all();
        sm_.record_interruption("resume");
    }

    void abort(AbortReason reason, const std::string& detail) {
        sm_.abort(reason, detail);
        deps_.channel->stop_output();
        pause_cv_.notify_all();
    }

    void end_turn() {
        sm_.record_interruption("end_of_turn");
        deps_.speech->cut_off();
    }

    void handle_control(ControlSignal signal) {
        switch (signal) {
            case ControlSignal::Pause:     pause(); break;
            case ControlSignal::Resume:    resume(); break;
            case ControlSignal::Abort:     abort(AbortReason::ExternalRequest, "candidate requested abort"); break;
            case ControlSignal::EndOfTurn: end_turn(); break;
        }
    }

    bool is_paused() const {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        return paused_;
    }

    SessionStateMachine& state_machine() { return sm_; }
    const SessionStateMachine& state_machine() const { return sm_; }

private:
    enum class Spoken {
        Delivered,
        Cancelled
    };

    void loop() {
        ScopedLogSession tag(session_id_);
        while (!sm_.is_finished()) {
            Phase phase = sm_.phase();

            if (phase != Phase::Closing && sm_.deadline_due()) {
                sm_.on_deadline();
                continue;
            }
            if (!deps_.channel->is_open()) {
                sm_.abort(AbortReason::CandidateDisconnected, "channel closed");
                break;
            }
            if (phase != Phase::Closing && !wait_while_paused()) {
                continue;
            }

            switch (phase) {
                case Phase::Greeting:
                    if (speak(config_.session.greeting, sm_.turn_token()) == Spoken::Cancelled) continue;
                    report(sm_.advance());
                    break;

                case Phase::Delivering:
                case Phase::FollowingUp:
                    if (speak(sm_.current_prompt(), sm_.turn_token()) == Spoken::Cancelled) continue;
                    report(sm_.on_delivered());
                    break;

                case Phase::Listening:
                    listen();
                    break;

                case Phase::Deciding:
                    report(sm_.advance());
                    break;

                case Phase::Advancing:
                    announce_no_answer();
                    report(sm_.advance());
                    break;

                case Phase::Closing:
                    speak(config_.session.closing, sm_.session_token());
                    report(sm_.complete());
                    break;

                case Phase::Created:
                case Phase::Completed:
                case Phase::Aborted:
                    return;
            }
        }
    }

    /// @return false if the wait ended for any reason other than resume
    bool wait_while_paused() {
        std::unique_lock<std::mutex> lock(pause_mutex_);
        while (paused_) {
            if (sm_.is_finished() || sm_.deadline_due()) {
                return false;
            }
            pause_cv_.wait_for(lock, Duration(20));
        }
        return true;
    }

    Spoken speak(const std::string& text, const CancellationToken& token) {
        if (text.empty()) {
            return token.is_cancelled() ? Spoken::Cancelled : Spoken::Delivered;
        }
        deps_.channel->send_text(text);
        if (token.is_cancelled()) {
            return Spoken::Cancelled;
        }

        auto channel = deps_.channel;
        auto spoken = deps_.speech->speak(text, [channel](const AudioChunk& chunk, int sample_rate) {
            channel->send_audio(chunk, sample_rate);
        }, token);

        if (spoken.is_error()) {
            if (spoken.error().type == ErrorType::Cancelled) {
                deps_.channel->stop_output();
                return Spoken::Cancelled;
            }
            LOG_WARN("[TTS] " + spoken.error().to_string() + "; delivered as text only");
            return Spoken::Delivered;
        }

        deps_.channel->wait_output_drained(token);
        if (token.is_cancelled()) {
            deps_.channel->stop_output();
            return Spoken::Cancelled;
        }
        return Spoken::Delivered;
    }

    void listen() {
        Duration item_left = sm_.item_remaining();

        Transcript transcript = Transcript::no_answer();
        if (item_left.count() > 0) {
            // Item maximum ends the turn like an explicit end-of-turn
            auto speech = deps_.speech;
            TimerId cutoff = deps_.timers->schedule_after(item_left, [speech]() {
                LOG_SESSION("Item maximum reached, cutting the answer off");
                speech->cut_off();
            }, "item max");
            auto turn = deps_.speech->transcribe(deps_.channel, sm_.turn_token());
            deps_.timers->cancel(cutoff);

            if (turn.is_error()) {
                const Error& error = turn.error();
                if (error.type == ErrorType::Cancelled) {
                    return;
                }
                LOG_WARN("[Session] listening failed (" + error.to_string() + "), recording no answer");
            } else {
                if (turn.value().reason == EndOfTurn::SourceClosed && !deps_.channel->is_open()) {
                    sm_.abort(AbortReason::CandidateDisconnected, "channel closed while listening");
                    return;
                }
                transcript = turn.value().transcript;
            }
        } else {
            LOG_SESSION("No time left for this item, recording no answer");
        }

        report(sm_.on_transcript(transcript));
    }

    void announce_no_answer() {
        auto last = sm_.last_exchange();
        if (!last || !last->answer.is_no_answer()) return;
        if (sm_.snapshot().plan.pending_count() == 0) return;
        speak(config_.session.no_answer_transition, sm_.turn_token());
    }

    void report(const VoidResult& result) {
        if (result.is_error()) {
            LOG_WARN("[Session] " + result.error().to_string());
        }
    }

    std::string session_id_;
    Config config_;
    SessionDependencies deps_;
    BudgetAllocator allocator_;
    DecisionEngine engine_;
    SessionStateMachine sm_;

    mutable std::mutex pause_mutex_;
    std::condition_variable pause_cv_;
    bool paused_;

    std::thread thread_;
};

namespace {

SessionDependencies checked(SessionDependencies deps) {
    if (!deps.clock || !deps.timers) {
        throw std::invalid_argument("InterviewSession needs a clock and a timer service");
    }
    if (!deps.speech || !deps.channel) {
        throw std::invalid_argument("InterviewSession needs a speech adapter and a candidate channel");
    }
    return deps;
}

} // namespace

InterviewSession::InterviewSession(SessionInfo info, const Config& config, SessionDependencies deps)
    : info_(std::move(info)),
      pimpl_(std::make_unique<Impl>(info_, config, checked(std::move(deps)))) {}

InterviewSession::~InterviewSession() = default;

VoidResult InterviewSession::start(QuestionPlan plan) {
    return pimpl_->start(std::move(plan));
}

VoidResult InterviewSession::run(QuestionPlan plan) {
    auto started = pimpl_->start(std::move(plan));
    if (started.is_error()) {
        return started;
    }
    pimpl_->join();
    return VoidResult();
}

void InterviewSession::join() { pimpl_->join(); }
void InterviewSession::pause() { pimpl_->pause(); }
void InterviewSession::resume() { pimpl_->resume(); }

void InterviewSession::abort(AbortReason reason, const std::string& detail) {
    pimpl_->abort(reason, detail);
}

void InterviewSession::end_turn() { pimpl_->end_turn(); }
void InterviewSession::handle_control(ControlSignal signal) { pimpl_->handle_control(signal); }

Phase InterviewSession::phase() const { return pimpl_->state_machine().phase(); }
bool InterviewSession::is_finished() const { return pimpl_->state_machine().is_finished(); }
bool InterviewSession::is_paused() const { return pimpl_->is_paused(); }
Session InterviewSession::snapshot() const { return pimpl_->state_machine().snapshot(); }
std::optional<SessionSummary> InterviewSession::summary() const { return pimpl_->state_machine().summary(); }

} // namespace viva
