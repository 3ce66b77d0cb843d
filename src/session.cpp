#include "session.h"
#include <unistd.h>
#include <atomic>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Created:     return "created";
        case Phase::Greeting:    return "greeting";
        case Phase::Delivering:  return "delivering";
        case Phase::Listening:   return "listening";
        case Phase::Deciding:    return "deciding";
        case Phase::FollowingUp: return "following_up";
        case Phase::Advancing:   return "advancing";
        case Phase::Closing:     return "closing";
        case Phase::Completed:   return "completed";
        case Phase::Aborted:     return "aborted";
    }
    return "unknown";
}

const char* abort_reason_name(AbortReason reason) {
    switch (reason) {
        case AbortReason::None:                  return "none";
        case AbortReason::ExternalRequest:       return "external_request";
        case AbortReason::CandidateDisconnected: return "candidate_disconnected";
        case AbortReason::DownstreamFailure:     return "downstream_failure";
        case AbortReason::Shutdown:              return "shutdown";
    }
    return "unknown";
}

std::string generate_session_id(const std::string& candidate_id) {
    std::time_t now = std::time(nullptr);
    std::tm tm_buf{};
    localtime_r(&now, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    if (!candidate_id.empty()) {
        ss << "_" << candidate_id;
    }
    // Process id plus a per-process sequence keeps ids unique within one second
    static std::atomic<unsigned> sequence{0};
    ss << "_" << ::getpid() << "-" << ++sequence;
    return ss.str();
}

json summary_to_json(const SessionSummary& summary) {
    json j;
    j["session_id"] = summary.info.id;
    j["candidate_id"] = summary.info.candidate_id;
    j["job_id"] = summary.info.job_id;
    j["interview_type"] = summary.info.interview_type;
    j["final_phase"] = phase_name(summary.final_phase);
    if (summary.abort_reason != AbortReason::None) {
        j["abort_reason"] = abort_reason_name(summary.abort_reason);
        if (!summary.abort_detail.empty()) j["abort_detail"] = summary.abort_detail;
    }
    j["total_elapsed_ms"] = summary.total_elapsed.count();
    j["deadline_reached"] = summary.deadline_reached;
    j["warnings"] = summary.warnings;

    j["interruptions"] = json::array();
    for (const auto& interruption : summary.interruptions) {
        j["interruptions"].push_back({{"kind", interruption.kind},
                                      {"offset_ms", interruption.offset.count()},
                                      {"item_id", interruption.item_id}});
    }

    j["history"] = json::array();
    for (const auto& exchange : summary.history) {
        j["history"].push_back(exchange_to_json(exchange));
    }

    j["items"] = json::array();
    for (const auto& item : summary.items) {
        j["items"].push_back(plan_item_to_json(item));
    }
    return j;
}

} // namespace viva
