#pragma once

#include "budget_allocator.h"
#include "cancellation.h"
#include "config.h"
#include "decision.h"
#include "question_plan.h"
#include "scoring/answer_scorer.h"
#include <optional>
#include <string>

namespace viva {

/**
 * @brief Snapshot handed to the decision engine for one answer
 */
struct DecisionInput {
    std::string item_id;
    std::string question;       ///< Text actually asked this round
    Transcript transcript;
    QuestionType type = QuestionType::Technical;
    Rubric rubric;
    Duration item_elapsed{0};   ///< All rounds of this item so far
    Duration item_max{0};
    int followups_issued = 0;
    BudgetState budget;
};

struct DecisionOutcome {
    std::optional<Decision> decision;   ///< Empty when the call was cancelled
    float coverage = -1.0f;             ///< -1 when not scored
    bool scoring_failed = false;
    bool cancelled = false;
};

/**
 * @brief Follow-up policy
 *
 * item budget = min(max - elapsed, remaining_total - pending_floor)
 *
 * - no answer                         -> ForceAdvance
 * - item budget < min follow-up cost  -> ForceAdvance
 * - coverage >= threshold             -> Advance
 * - depth left                        -> FollowUp
 * - otherwise                         -> Advance
 *
 * A failed or timed-out scorer call yields Advance with scoring_failed set.
 * Cancellation returns no decision.
 */
class DecisionEngine {
public:
    DecisionEngine(const DecisionConfig& config, AnswerScorerPtr scorer, Duration scoring_timeout);

    DecisionOutcome decide(const DecisionInput& input, const CancellationToken& cancel) const;

    static Duration item_remaining(const DecisionInput& input);

    const DecisionConfig& config() const { return config_; }

private:
    DecisionConfig config_;
    AnswerScorerPtr scorer_;
    Duration scoring_timeout_;
};

} // namespace viva
