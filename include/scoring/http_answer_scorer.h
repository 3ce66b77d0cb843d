#pragma once

#include "config.h"
#include "scoring/answer_scorer.h"
#include <memory>

namespace viva {

/**
 * @brief Scores answers through an OpenAI-compatible chat completions endpoint
 *
 * The model is asked for {"coverage": 0..1, "follow_up": "..."}; the reply
 * may be wrapped in a markdown code fence. The transfer is aborted when the
 * token is cancelled. The API key is read from the environment variable named
 * in ScorerConfig::api_key_env (no Authorization header if unset).
 */
class HttpAnswerScorer : public IAnswerScorer {
public:
    HttpAnswerScorer(const ScorerConfig& config, int timeout_ms);
    ~HttpAnswerScorer();

    HttpAnswerScorer(const HttpAnswerScorer&) = delete;
    HttpAnswerScorer& operator=(const HttpAnswerScorer&) = delete;

    Result<Score> score(const ScoreRequest& request, const CancellationToken& cancel) override;
    std::string name() const override { return "http"; }

    /// Parse the model's message content into a Score. Exposed for tests.
    static Result<Score> parse_reply(const std::string& content);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
