#include "decision_engine.h"
#include "async_call.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>

namespace viva {

DecisionEngine::DecisionEngine(const DecisionConfig& config, AnswerScorerPtr scorer, Duration scoring_timeout)
    : config_(config), scorer_(std::move(scorer)), scoring_timeout_(scoring_timeout) {}

Duration DecisionEngine::item_remaining(const DecisionInput& input) {
    Duration by_item = input.item_max - input.item_elapsed;
    Duration by_session = input.budget.remaining_total - input.budget.pending_floor;
    return std::max(Duration(0), std::min(by_item, by_session));
}

DecisionOutcome DecisionEngine::decide(const DecisionInput& input, const CancellationToken& cancel) const {
    DecisionOutcome outcome;

    if (cancel.is_cancelled()) {
        outcome.cancelled = true;
        return outcome;
    }

    if (input.transcript.is_no_answer() || utils::is_blank_transcript(input.transcript.text)) {
        LOG_DECISION(input.item_id + ": no answer, force advance");
        outcome.decision = ForceAdvance{};
        return outcome;
    }

    Duration remaining = item_remaining(input);
    if (remaining < config_.min_followup_cost()) {
        LOG_DECISION(input.item_id + ": " + utils::format_duration_ms(remaining.count()) +
                     " left, below follow-up cost, force advance");
        outcome.decision = ForceAdvance{};
        return outcome;
    }

    if (!scorer_) {
        outcome.decision = Advance{};
        return outcome;
    }

    ScoreRequest request;
    request.item_id = input.item_id;
    request.question = input.question;
    request.answer = input.transcript.text;
    request.type = input.type;
    request.rubric = input.rubric;
    request.followups_issued = input.followups_issued;

    auto scorer = scorer_;
    auto call = run_with_timeout<Result<Score>>(
        "scoring",
        [scorer, request](const CancellationToken& token) { return scorer->score(request, token); },
        scoring_timeout_, cancel);

    if (call.status == CallStatus::Cancelled) {
        LOG_DECISION(input.item_id + ": scoring cancelled (" + call.error + ")");
        outcome.cancelled = true;
        return outcome;
    }

    if (!call.ok() || call.value->is_error()) {
        std::string why = call.ok() ? call.value->error().to_string() : call.error;
        LOG_WARN("[Decision] " + input.item_id + ": scoring " + call_status_name(call.status) +
                 " (" + why + "), advancing");
        outcome.scoring_failed = true;
        outcome.decision = Advance{};
        return outcome;
    }

    const Score& score = call.value->value();
    outcome.coverage = score.coverage;

    if (score.coverage >= config_.coverage_threshold) {
        outcome.decision = Advance{};
    } else if (input.followups_issued < config_.max_followup_depth) {
        std::string text = utils::is_empty_or_whitespace(score.follow_up)
            ? config_.default_followup_prompt : score.follow_up;
        outcome.decision = FollowUp{text};
    } else {
        outcome.decision = Advance{};
    }

    LOG_DECISION(input.item_id + ": coverage=" + std::to_string(score.coverage) + " -> " +
                 decision_name(*outcome.decision));
    return outcome;
}

} // namespace viva
