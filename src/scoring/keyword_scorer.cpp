#include "scoring/keyword_scorer.h"
#include "logger.h"
#include "utils.h"

namespace viva {

Result<Score> KeywordScorer::score(const ScoreRequest& request, const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return make_cancelled_error(cancel.reason());
    }

    Score result;
    const auto& keywords = request.rubric.keywords;
    if (keywords.empty()) {
        result.coverage = 1.0f;
        return result;
    }

    size_t counted = 0;
    size_t found = 0;
    std::string first_missing;
    for (const auto& keyword : keywords) {
        if (utils::is_empty_or_whitespace(keyword)) continue;
        ++counted;
        if (utils::contains_phrase(request.answer, keyword)) {
            ++found;
        } else if (first_missing.empty()) {
            first_missing = utils::trim_copy(keyword);
        }
    }

    result.coverage = counted == 0 ? 1.0f : static_cast<float>(found) / static_cast<float>(counted);
    if (!first_missing.empty()) {
        result.follow_up = "Could you also talk about " + first_missing + "?";
    }
    LOG_SCORER(request.item_id + " keywords " + std::to_string(found) + "/" + std::to_string(counted));
    return result;
}

} // namespace viva
