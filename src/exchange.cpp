#include "exchange.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

json exchange_to_json(const Exchange& exchange) {
    json j;
    j["item_id"] = exchange.item_id;
    j["question"] = exchange.question;
    j["answer"] = exchange.answer.text;
    j["no_answer"] = exchange.answer.is_no_answer();
    j["decision"] = decision_name(exchange.decision);
    if (is_follow_up(exchange.decision)) {
        j["follow_up"] = decision_text(exchange.decision);
    }
    j["elapsed_ms"] = exchange.elapsed.count();
    j["offset_ms"] = exchange.offset.count();
    j["round"] = exchange.round;
    if (exchange.coverage >= 0.0f) {
        j["coverage"] = exchange.coverage;
    }
    j["scoring_failed"] = exchange.scoring_failed;
    if (exchange.answer.processing_ms > 0) {
        j["stt_ms"] = exchange.answer.processing_ms;
    }
    return j;
}

} // namespace viva
