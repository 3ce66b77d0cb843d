/**
 * Follow-up policy: no-answer and no-time shortcuts, coverage threshold,
 * depth limit, fail-open scoring.
 *
 * Run from build dir: ./test_decision_engine
 */

#include "decision_engine.h"
#include "fakes.h"
#include <iostream>
#include <memory>
#include <string>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static DecisionConfig policy() {
    DecisionConfig config;
    config.coverage_threshold = 0.6f;
    config.max_followup_depth = 1;
    config.min_followup_cost_s = 60;
    config.default_followup_prompt = "Can you give an example?";
    return config;
}

static DecisionInput answered(const std::string& text) {
    DecisionInput input;
    input.item_id = "q1";
    input.question = "How would you shard this table?";
    input.transcript.text = text;
    input.transcript.confidence = 0.9f;
    input.rubric.keywords = {"hash", "rebalancing"};
    input.item_elapsed = minutes(2);
    input.item_max = minutes(12);
    input.budget.remaining_total = minutes(25);
    input.budget.pending_floor = minutes(6);
    input.budget.remaining_items = 3;
    return input;
}

static void test_item_remaining() {
    DecisionInput input = answered("x");
    ASSERT(DecisionEngine::item_remaining(input) == minutes(10));

    input.budget.remaining_total = minutes(8);
    ASSERT(DecisionEngine::item_remaining(input) == minutes(2));

    input.budget.remaining_total = minutes(1);
    ASSERT(DecisionEngine::item_remaining(input) == Duration(0));
}

static void test_no_answer_forces_advance() {
    auto scorer = std::make_shared<FakeScorer>(0.0f);
    DecisionEngine engine(policy(), scorer, Duration(1000));
    CancellationSource turn;

    DecisionInput input = answered("");
    input.transcript = Transcript::no_answer();
    auto outcome = engine.decide(input, turn.token());
    ASSERT(outcome.decision && is_force_advance(*outcome.decision));

    input.transcript.text = "[BLANK_AUDIO]";
    outcome = engine.decide(input, turn.token());
    ASSERT(outcome.decision && is_force_advance(*outcome.decision));

    ASSERT(scorer->calls() == 0);
}

static void test_no_time_forces_advance() {
    auto scorer = std::make_shared<FakeScorer>(0.0f);
    DecisionEngine engine(policy(), scorer, Duration(1000));
    CancellationSource turn;

    DecisionInput input = answered("I would use hash partitioning.");
    input.item_elapsed = minutes(12) - Duration(30 * 1000);
    auto outcome = engine.decide(input, turn.token());
    ASSERT(outcome.decision && is_force_advance(*outcome.decision));

    input = answered("I would use hash partitioning.");
    input.budget.remaining_total = input.budget.pending_floor + Duration(59 * 1000);
    outcome = engine.decide(input, turn.token());
    ASSERT(outcome.decision && is_force_advance(*outcome.decision));

    ASSERT(scorer->calls() == 0);
}

static void test_coverage_threshold() {
    CancellationSource turn;

    DecisionEngine good(policy(), std::make_shared<FakeScorer>(0.8f), Duration(1000));
    auto outcome = good.decide(answered("hash and rebalancing"), turn.token());
    ASSERT(outcome.decision && is_advance(*outcome.decision));
    ASSERT(outcome.coverage > 0.79f && outcome.coverage < 0.81f);
    ASSERT(!outcome.scoring_failed);

    DecisionEngine exact(policy(), std::make_shared<FakeScorer>(0.6f), Duration(1000));
    outcome = exact.decide(answered("hash"), turn.token());
    ASSERT(outcome.decision && is_advance(*outcome.decision));
}

static void test_follow_up_and_depth() {
    CancellationSource turn;

    auto scorer = std::make_shared<FakeScorer>(0.2f, FakeScorer::Mode::Fixed, "What about rebalancing?");
    DecisionEngine engine(policy(), scorer, Duration(1000));
    auto outcome = engine.decide(answered("hash"), turn.token());
    ASSERT(outcome.decision && is_follow_up(*outcome.decision));
    ASSERT(decision_text(*outcome.decision) == "What about rebalancing?");
    ASSERT(scorer->last_request().rubric.keywords.size() == 2);
    ASSERT(scorer->last_request().question == "How would you shard this table?");

    DecisionEngine no_text(policy(), std::make_shared<FakeScorer>(0.2f), Duration(1000));
    outcome = no_text.decide(answered("hash"), turn.token());
    ASSERT(outcome.decision && decision_text(*outcome.decision) == "Can you give an example?");

    DecisionInput deep = answered("hash");
    deep.followups_issued = 1;
    outcome = engine.decide(deep, turn.token());
    ASSERT(outcome.decision && is_advance(*outcome.decision));
}

static void test_scoring_fails_open() {
    CancellationSource turn;

    DecisionEngine failing(policy(), std::make_shared<FakeScorer>(0.0f, FakeScorer::Mode::Fail), Duration(1000));
    auto outcome = failing.decide(answered("hash"), turn.token());
    ASSERT(outcome.decision && is_advance(*outcome.decision));
    ASSERT(outcome.scoring_failed);

    DecisionEngine slow(policy(), std::make_shared<FakeScorer>(0.0f, FakeScorer::Mode::Slow), Duration(30));
    outcome = slow.decide(answered("hash"), turn.token());
    ASSERT(outcome.decision && is_advance(*outcome.decision));
    ASSERT(outcome.scoring_failed);
    ASSERT(!outcome.cancelled);

    DecisionEngine unscored(policy(), nullptr, Duration(30));
    outcome = unscored.decide(answered("hash"), turn.token());
    ASSERT(outcome.decision && is_advance(*outcome.decision));
}

static void test_cancellation() {
    auto scorer = std::make_shared<FakeScorer>(0.0f, FakeScorer::Mode::Slow);
    DecisionEngine engine(policy(), scorer, Duration(0));

    CancellationSource cancelled;
    cancelled.cancel("deadline");
    auto outcome = engine.decide(answered("hash"), cancelled.token());
    ASSERT(!outcome.decision);
    ASSERT(outcome.cancelled);

    CancellationSource turn;
    std::thread deadline([turn]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        turn.cancel("deadline");
    });
    outcome = engine.decide(answered("hash"), turn.token());
    deadline.join();
    ASSERT(!outcome.decision);
    ASSERT(outcome.cancelled);
}

int main() {
    test_item_remaining();
    test_no_answer_forces_advance();
    test_no_time_forces_advance();
    test_coverage_threshold();
    test_follow_up_and_depth();
    test_scoring_fails_open();
    test_cancellation();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All decision engine tests passed.\n";
    return 0;
}
