#pragma once

#include "budget_allocator.h"
#include "common.h"
#include "exchange.h"
#include "question_plan.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace viva {

enum class Phase {
    Created,
    Greeting,
    Delivering,
    Listening,
    Deciding,
    FollowingUp,
    Advancing,
    Closing,
    Completed,
    Aborted
};

const char* phase_name(Phase phase);

inline bool is_terminal(Phase phase) {
    return phase == Phase::Completed || phase == Phase::Aborted;
}

enum class AbortReason {
    None,
    ExternalRequest,
    CandidateDisconnected,
    DownstreamFailure,
    Shutdown
};

const char* abort_reason_name(AbortReason reason);

struct SessionInfo {
    std::string id;
    std::string candidate_id;
    std::string job_id;
    std::string interview_type = "standard";
};

/// Session id from the wall clock, candidate, process id and a sequence ("20260314_101500_c42_4711-1").
std::string generate_session_id(const std::string& candidate_id);

struct TransitionRecord {
    Phase from = Phase::Created;
    Phase to = Phase::Created;
    Duration offset{0};
    std::string item_id;
    std::string note;
};

/// Pause/resume/end-of-turn requests as they arrived.
struct Interruption {
    std::string kind;
    Duration offset{0};
    std::string item_id;
};

/**
 * @brief Canonical state of one interview
 *
 * Written only by SessionStateMachine; everyone else sees copies.
 */
struct Session {
    SessionInfo info;
    TimePoint started_at{};
    TimePoint deadline{};
    Phase phase = Phase::Created;
    std::string active_item_id;
    QuestionPlan plan;
    std::vector<Exchange> history;
    BudgetState budget;
    std::vector<std::string> warnings;
    std::vector<Interruption> interruptions;
    std::vector<TransitionRecord> transitions;
    AbortReason abort_reason = AbortReason::None;
    std::string abort_detail;
    bool deadline_reached = false;
};

/**
 * @brief Emitted once when a session reaches Completed or Aborted
 */
struct SessionSummary {
    SessionInfo info;
    Phase final_phase = Phase::Created;
    std::vector<Exchange> history;
    std::vector<PlanItem> items;
    AbortReason abort_reason = AbortReason::None;
    std::string abort_detail;
    std::vector<std::string> warnings;
    std::vector<Interruption> interruptions;
    Duration total_elapsed{0};
    bool deadline_reached = false;
};

nlohmann::json summary_to_json(const SessionSummary& summary);

/**
 * @brief Outbound record stream
 *
 * Called from the session thread (or the thread that aborted the session),
 * never while the state machine holds its lock.
 */
class ISessionSink {
public:
    virtual ~ISessionSink() = default;
    virtual void on_exchange(const SessionInfo& info, const Exchange& exchange) = 0;
    virtual void on_summary(const SessionSummary& summary) = 0;
};

} // namespace viva
