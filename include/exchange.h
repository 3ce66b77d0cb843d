#pragma once

#include "common.h"
#include "decision.h"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace viva {

/**
 * @brief One question/answer round
 *
 * Built once when the state machine leaves Listening/Deciding and never
 * modified afterwards.
 */
struct Exchange {
    std::string item_id;
    std::string question;       ///< Question or follow-up text actually asked
    Transcript answer;
    Decision decision = ForceAdvance{};
    Duration elapsed{0};        ///< Delivery start to decision
    Duration offset{0};         ///< Decision time relative to session start
    int round = 0;              ///< 0 = main question, 1.. = follow-ups
    float coverage = -1.0f;     ///< -1 when not scored
    bool scoring_failed = false;
};

nlohmann::json exchange_to_json(const Exchange& exchange);

} // namespace viva
