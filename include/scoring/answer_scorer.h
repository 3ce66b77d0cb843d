#pragma once

#include "cancellation.h"
#include "errors.h"
#include "question_plan.h"
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Everything a scorer may look at for one answer
 */
struct ScoreRequest {
    std::string item_id;
    std::string question;
    std::string answer;
    QuestionType type = QuestionType::Technical;
    Rubric rubric;
    int followups_issued = 0;
};

struct Score {
    float coverage = 0.0f;      ///< 0..1, how much of the rubric the answer covers
    std::string follow_up;      ///< Suggested probing question; empty = use the default prompt
};

/**
 * @brief Reasoning subsystem that rates answer coverage
 *
 * Implementations are called from a worker thread and may be abandoned on
 * timeout; they should return early once the token is cancelled.
 */
class IAnswerScorer {
public:
    virtual ~IAnswerScorer() = default;

    virtual Result<Score> score(const ScoreRequest& request, const CancellationToken& cancel) = 0;

    virtual std::string name() const = 0;
};

using AnswerScorerPtr = std::shared_ptr<IAnswerScorer>;

} // namespace viva
