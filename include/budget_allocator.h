#pragma once

#include "common.h"
#include "question_plan.h"
#include <string>
#include <utility>
#include <vector>

namespace viva {

/**
 * @brief Snapshot of the session's remaining time budget
 *
 * Produced only by BudgetAllocator.
 */
struct BudgetState {
    Duration remaining_total{0};   ///< deadline - now, never negative
    size_t remaining_items = 0;    ///< Pending items plus the active one
    Duration pending_floor{0};     ///< Sum of minimums of un-started items
};

struct AllocationResult {
    std::vector<std::pair<std::string, Duration>> targets;  ///< Per pending item, plan order
    std::vector<std::string> skipped;                       ///< Items dropped to fit the minimums
    bool budget_exhausted = false;
    BudgetState budget;
};

/**
 * @brief Redistributes the remaining time across the remaining items
 *
 * slack = remaining - outstanding minimum of the active item - pending minimums,
 * shared by weight and clamped to each item's maximum (clamped excess goes to
 * the unclamped items). When the minimums do not fit, the lowest-weight
 * pending items are skipped (later items first on ties) until they do.
 *
 * Stateless; safe to share between sessions.
 */
class BudgetAllocator {
public:
    /**
     * @brief Compute an allocation without touching the plan
     * @param active_elapsed Time already spent on the active item (ignored if none)
     */
    AllocationResult compute(const QuestionPlan& plan, Duration active_elapsed,
                             TimePoint now, TimePoint deadline) const;

    /// compute() and then write targets and skips into the plan.
    AllocationResult apply(QuestionPlan& plan, Duration active_elapsed,
                           TimePoint now, TimePoint deadline) const;

    /// Budget snapshot for the plan as it stands.
    static BudgetState budget_state(const QuestionPlan& plan, TimePoint now, TimePoint deadline);
};

} // namespace viva
