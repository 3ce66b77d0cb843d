/**
 * End-to-end interview runs on the session thread with scripted speech,
 * an in-memory candidate channel and a manual interview clock.
 *
 * Run from build dir: ./test_interview_session
 */

#include "fakes.h"
#include "interview_session.h"
#include "scoring/keyword_scorer.h"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static Config test_config() {
    Config config;
    config.session.deadline_s = 1800;
    config.session.greeting = "Welcome.";
    config.session.closing = "Thank you, goodbye.";
    config.session.no_answer_transition = "Let's move on.";
    config.timeouts.synthesis_ms = 2000;
    config.timeouts.transcription_ms = 2000;
    config.timeouts.scoring_ms = 2000;
    return config;
}

static QuestionPlan standard_plan() {
    return QuestionPlan({make_item("q1", 180, 480, 720, 1.0, {"cache"}),
                         make_item("q2", 180, 480, 720, 1.0, {"cache"}),
                         make_item("q3", 180, 480, 720, 1.0, {"cache"})});
}

/// Collaborators for one session; the session itself is declared last so it goes first.
struct Harness {
    Harness(std::vector<ScriptedTurn> script, AnswerScorerPtr scorer = std::make_shared<KeywordScorer>(),
            FakeStream::Mode tts = FakeStream::Mode::Normal)
        : timers(clock, Duration(5)),
          synth(std::make_shared<FakeSynthesizer>(tts)),
          transcriber(std::make_shared<FakeTranscriber>(&clock, std::move(script))),
          channel(std::make_shared<FakeChannel>()),
          scorer(std::move(scorer)) {
        timers.start();
    }

    ~Harness() {
        session.reset();
        timers.stop();
    }

    InterviewSession& make(const Config& config, std::shared_ptr<ITranscriber> listener = nullptr) {
        SessionDependencies deps;
        deps.clock = &clock;
        deps.timers = &timers;
        deps.speech = std::make_shared<SpeechIOAdapter>(
            synth, listener ? listener : std::shared_ptr<ITranscriber>(transcriber), config.timeouts);
        deps.channel = channel;
        deps.scorer = scorer;
        deps.sink = &sink;

        SessionInfo info;
        info.id = "it_" + std::to_string(++counter);
        info.candidate_id = "c42";
        session = std::make_unique<InterviewSession>(info, config, deps);
        return *session;
    }

    bool said(const std::string& text) const {
        auto texts = channel->texts();
        return std::find(texts.begin(), texts.end(), text) != texts.end();
    }

    ManualClock clock;
    TimerService timers;
    std::shared_ptr<FakeSynthesizer> synth;
    std::shared_ptr<FakeTranscriber> transcriber;
    std::shared_ptr<FakeChannel> channel;
    AnswerScorerPtr scorer;
    RecordingSink sink;
    std::unique_ptr<InterviewSession> session;
    static int counter;
};

int Harness::counter = 0;

/// Keeps talking (5s of interview time per step) until the turn is cut off.
class TalkingTranscriber : public ITranscriber {
public:
    TalkingTranscriber(ManualClock* clock, std::string text) : clock_(clock), text_(std::move(text)) {}

    Result<TurnResult> transcribe(std::shared_ptr<IAudioSource>, const CancellationToken& cancel) override {
        cut_ = false;
        TimePoint began = clock_->now();
        for (int step = 0; step < 2000; ++step) {
            if (cancel.is_cancelled()) return make_cancelled_error("turn cancelled");
            if (cut_) {
                TurnResult result;
                result.transcript.text = text_;
                result.transcript.confidence = 0.9f;
                result.reason = EndOfTurn::Cutoff;
                result.speech = std::chrono::duration_cast<Duration>(clock_->now() - began);
                return result;
            }
            clock_->advance(Duration(5000));
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        TurnResult silent;
        silent.transcript = Transcript::no_answer();
        return silent;
    }

    void cut_off() override {
        cut_ = true;
        ++cutoffs_;
    }

    int cutoffs() const { return cutoffs_; }

private:
    ManualClock* clock_;
    std::string text_;
    std::atomic<bool> cut_{false};
    std::atomic<int> cutoffs_{0};
};

static void test_answers_every_question() {
    Harness h({ScriptedTurn::answer("I would add a cache.", minutes(2)),
               ScriptedTurn::answer("A cache with TTLs.", minutes(2)),
               ScriptedTurn::answer("Cache the hot keys.", minutes(2))});
    InterviewSession& session = h.make(test_config());

    ASSERT(session.run(standard_plan()).is_ok());
    ASSERT(session.phase() == Phase::Completed);

    auto summary = session.summary();
    ASSERT(summary.has_value());
    ASSERT(summary && summary->history.size() == 3);
    for (const auto& exchange : summary->history) {
        ASSERT(is_advance(exchange.decision));
        ASSERT(!exchange.answer.is_no_answer());
    }
    for (const auto& item : summary->items) {
        ASSERT(item.status == ItemStatus::Answered);
    }
    ASSERT(summary && summary->total_elapsed < minutes(30));
    ASSERT(summary && summary->warnings.empty());

    auto texts = h.channel->texts();
    ASSERT(texts.size() == 5);
    ASSERT(texts.front() == "Welcome.");
    ASSERT(h.said("Question q2?"));
    ASSERT(texts.back() == "Thank you, goodbye.");
    ASSERT(h.channel->audio_chunks() > 0);
    ASSERT(h.sink.exchanges().size() == 3);
    ASSERT(h.sink.summaries().size() == 1);
}

static void test_transcription_timeout_records_no_answer() {
    Harness h({ScriptedTurn::answer("I would add a cache.", minutes(2)),
               ScriptedTurn::hangs(),
               ScriptedTurn::answer("Cache the hot keys.", minutes(2))});
    Config config = test_config();
    config.timeouts.transcription_ms = 100;
    InterviewSession& session = h.make(config);

    ASSERT(session.run(standard_plan()).is_ok());
    ASSERT(session.phase() == Phase::Completed);

    auto summary = session.summary();
    ASSERT(summary && summary->history.size() == 3);
    const Exchange& second = summary->history[1];
    ASSERT(second.item_id == "q2");
    ASSERT(second.answer.is_no_answer());
    ASSERT(second.answer.text == NO_ANSWER_SENTINEL);
    ASSERT(is_force_advance(second.decision));
    ASSERT(is_advance(summary->history[2].decision));

    Session snapshot = session.snapshot();
    ASSERT(snapshot.plan.find("q2")->status == ItemStatus::Skipped);
    ASSERT(snapshot.plan.find("q3")->status == ItemStatus::Answered);
    ASSERT(h.said("Let's move on."));
}

static void test_deadline_closes_gracefully() {
    Harness h({ScriptedTurn::answer("I would add a cache.", minutes(4)),
               ScriptedTurn::answer("Let me think about the cache.", minutes(7))});
    Config config = test_config();
    config.session.deadline_s = 600;
    QuestionPlan plan({make_item("q1", 60, 120, 720, 1.0, {"cache"}),
                       make_item("q2", 60, 120, 720, 1.0, {"cache"}),
                       make_item("q3", 60, 120, 720, 1.0, {"cache"})});
    InterviewSession& session = h.make(config);

    ASSERT(session.run(std::move(plan)).is_ok());
    ASSERT(session.phase() == Phase::Completed);

    auto summary = session.summary();
    ASSERT(summary && summary->deadline_reached);
    ASSERT(summary && summary->history.size() == 2);
    ASSERT(summary && is_force_advance(summary->history.back().decision));

    Duration total{0};
    for (const auto& exchange : summary->history) total += exchange.elapsed;
    ASSERT(total <= minutes(10));

    Session snapshot = session.snapshot();
    ASSERT(snapshot.plan.find("q1")->status == ItemStatus::Answered);
    ASSERT(snapshot.plan.find("q3")->status == ItemStatus::Skipped);
    ASSERT(snapshot.plan.find("q3")->skip_reason == "deadline");
    ASSERT(h.channel->texts().back() == "Thank you, goodbye.");
    ASSERT(!h.said("Question q3?"));
}

static void test_item_maximum_cuts_answer_off() {
    Harness h({});
    auto talker = std::make_shared<TalkingTranscriber>(&h.clock, "The cache sits in front of the database.");
    Config config = test_config();
    config.timeouts.transcription_ms = 60000;
    QuestionPlan plan({make_item("q1", 60, 90, 120, 1.0, {"cache"})});
    InterviewSession& session = h.make(config, talker);

    ASSERT(session.run(std::move(plan)).is_ok());
    ASSERT(session.phase() == Phase::Completed);
    ASSERT(talker->cutoffs() >= 1);

    auto summary = session.summary();
    ASSERT(summary && summary->history.size() == 1);
    ASSERT(summary && !summary->deadline_reached);
    const Exchange& exchange = summary->history[0];
    ASSERT(!exchange.answer.is_no_answer());
    ASSERT(exchange.answer.text == "The cache sits in front of the database.");
    ASSERT(!is_follow_up(exchange.decision));
    ASSERT(session.snapshot().plan.find("q1")->status == ItemStatus::Answered);
    ASSERT(!h.said("Let's move on."));
}

static void test_control_signals_and_abort() {
    Harness h({ScriptedTurn::hangs()});
    Config config = test_config();
    config.timeouts.transcription_ms = 0;  // listen until the item runs out
    InterviewSession& session = h.make(config);

    ASSERT(session.start(standard_plan()).is_ok());
    ASSERT(session.start(standard_plan()).is_error());
    ASSERT(eventually([&]() { return session.phase() == Phase::Listening; }));

    h.channel->emit(ControlSignal::Pause);
    ASSERT(session.is_paused());
    h.channel->emit(ControlSignal::Resume);
    ASSERT(!session.is_paused());
    h.channel->emit(ControlSignal::EndOfTurn);
    ASSERT(h.transcriber->was_cut_off());

    h.channel->emit(ControlSignal::Abort);
    session.join();
    ASSERT(session.phase() == Phase::Aborted);
    ASSERT(session.is_finished());

    auto summary = session.summary();
    ASSERT(summary && summary->abort_reason == AbortReason::ExternalRequest);
    ASSERT(summary && summary->interruptions.size() == 3);
    ASSERT(summary && summary->interruptions[0].kind == "pause");
    ASSERT(summary && summary->interruptions[2].kind == "end_of_turn");
    ASSERT(h.sink.summaries().size() == 1);

    session.abort(AbortReason::Shutdown);
    ASSERT(session.summary()->abort_reason == AbortReason::ExternalRequest);
}

static void test_pause_holds_at_step_boundary() {
    Harness h({ScriptedTurn::answer("A cache.", minutes(1))});
    QuestionPlan plan({make_item("q1", 60, 120, 720, 1.0, {"cache"})});
    InterviewSession& session = h.make(test_config());

    session.pause();
    ASSERT(session.start(std::move(plan)).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT(session.phase() == Phase::Greeting);
    ASSERT(h.channel->texts().empty());

    session.resume();
    session.join();
    ASSERT(session.phase() == Phase::Completed);
    ASSERT(h.said("Welcome."));
}

static void test_disconnect_aborts() {
    Harness h({});
    h.channel->close();
    InterviewSession& session = h.make(test_config());

    ASSERT(session.run(standard_plan()).is_ok());
    ASSERT(session.phase() == Phase::Aborted);
    ASSERT(session.summary()->abort_reason == AbortReason::CandidateDisconnected);
}

static void test_downstream_failures_are_absorbed() {
    Harness h({ScriptedTurn::answer("Something about a cache.", minutes(2))},
              std::make_shared<FakeScorer>(0.0f, FakeScorer::Mode::Fail),
              FakeStream::Mode::Fail);
    QuestionPlan plan({make_item("q1", 60, 120, 720, 1.0, {"cache"})});
    InterviewSession& session = h.make(test_config());

    ASSERT(session.run(std::move(plan)).is_ok());
    ASSERT(session.phase() == Phase::Completed);

    auto summary = session.summary();
    ASSERT(summary && summary->history.size() == 1);
    ASSERT(summary && is_advance(summary->history[0].decision));
    ASSERT(summary && summary->history[0].scoring_failed);
    // Synthesis failed every time: the text still reached the candidate
    ASSERT(h.said("Question q1?"));
    ASSERT(h.channel->audio_chunks() == 0);
}

static void test_rejects_bad_input() {
    Harness h({});
    InterviewSession& session = h.make(test_config());
    auto started = session.start(QuestionPlan());
    ASSERT(started.is_error());
    ASSERT(started.error().type == ErrorType::InvalidPlan);
    ASSERT(session.phase() == Phase::Created);
    ASSERT(!session.is_finished());

    bool threw = false;
    try {
        SessionDependencies missing;
        missing.clock = &h.clock;
        missing.timers = &h.timers;
        InterviewSession broken(SessionInfo(), test_config(), missing);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT(threw);
}

int main() {
    test_answers_every_question();
    test_transcription_timeout_records_no_answer();
    test_deadline_closes_gracefully();
    test_item_maximum_cuts_answer_off();
    test_control_signals_and_abort();
    test_pause_holds_at_step_boundary();
    test_disconnect_aborts();
    test_downstream_failures_are_absorbed();
    test_rejects_bad_input();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All interview session tests passed.\n";
    return 0;
}
