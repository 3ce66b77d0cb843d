#pragma once

#include "scoring/answer_scorer.h"

namespace viva {

/**
 * @brief Local scorer: fraction of rubric keywords the answer mentions
 *
 * Keywords match as whole words/phrases after normalization. An item
 * without keywords scores full coverage. The follow-up asks about the first
 * keyword that was not mentioned.
 */
class KeywordScorer : public IAnswerScorer {
public:
    Result<Score> score(const ScoreRequest& request, const CancellationToken& cancel) override;
    std::string name() const override { return "keyword"; }
};

} // namespace viva
