#include "budget_allocator.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cmath>

namespace viva {

namespace {

Duration remaining_until(TimePoint now, TimePoint deadline) {
    if (deadline <= now) return Duration(0);
    return std::chrono::duration_cast<Duration>(deadline - now);
}

struct Candidate {
    size_t index;          ///< Position in plan order
    const PlanItem* item;
    bool skipped = false;
    double target_ms = 0.0;
};

} // namespace

BudgetState BudgetAllocator::budget_state(const QuestionPlan& plan, TimePoint now, TimePoint deadline) {
    BudgetState state;
    state.remaining_total = remaining_until(now, deadline);
    state.pending_floor = plan.pending_minimum_sum();
    state.remaining_items = plan.pending_count() + (plan.active() ? 1 : 0);
    return state;
}

AllocationResult BudgetAllocator::compute(const QuestionPlan& plan, Duration active_elapsed,
                                          TimePoint now, TimePoint deadline) const {
    AllocationResult result;
    const Duration remaining = remaining_until(now, deadline);

    Duration outstanding{0};
    if (const PlanItem* active = plan.active()) {
        outstanding = std::max(Duration(0), active->min_time - active_elapsed);
    }

    std::vector<Candidate> candidates;
    size_t index = 0;
    for (const auto& item : plan.items()) {
        if (item.is_pending()) {
            candidates.push_back(Candidate{index, &item});
        }
        ++index;
    }

    auto floor_sum = [&candidates]() {
        Duration sum{0};
        for (const auto& c : candidates) {
            if (!c.skipped) sum += c.item->min_time;
        }
        return sum;
    };

    // Drop items until the minimums fit
    while (floor_sum() + outstanding > remaining) {
        Candidate* victim = nullptr;
        for (auto& c : candidates) {
            if (c.skipped) continue;
            if (!victim || c.item->weight < victim->item->weight ||
                (c.item->weight == victim->item->weight && c.index > victim->index)) {
                victim = &c;
            }
        }
        if (!victim) break;
        victim->skipped = true;
        result.skipped.push_back(victim->item->id);
        result.budget_exhausted = true;
    }

    // Water-fill the slack by weight, respecting maximums
    double pool = static_cast<double>((remaining - outstanding - floor_sum()).count());
    if (pool < 0.0) pool = 0.0;

    std::vector<Candidate*> open;
    for (auto& c : candidates) {
        if (c.skipped) continue;
        c.target_ms = static_cast<double>(c.item->min_time.count());
        open.push_back(&c);
    }

    while (!open.empty() && pool > 0.0) {
        double total_weight = 0.0;
        for (const auto* c : open) total_weight += c->item->weight;
        if (total_weight <= 0.0) break;

        std::vector<Candidate*> still_open;
        double consumed = 0.0;
        bool clamped_any = false;
        for (auto* c : open) {
            double headroom = static_cast<double>(c->item->max_time.count()) - c->target_ms;
            double share = pool * c->item->weight / total_weight;
            if (share >= headroom) {
                c->target_ms += headroom;
                consumed += headroom;
                clamped_any = true;
            } else {
                still_open.push_back(c);
            }
        }

        if (!clamped_any) {
            for (auto* c : open) {
                c->target_ms += pool * c->item->weight / total_weight;
            }
            pool = 0.0;
            break;
        }
        pool -= consumed;
        open.swap(still_open);
    }

    for (const auto& c : candidates) {
        if (c.skipped) continue;
        auto target = Duration(static_cast<int64_t>(std::floor(c.target_ms)));
        target = std::max(c.item->min_time, std::min(target, c.item->max_time));
        result.targets.emplace_back(c.item->id, target);
    }

    result.budget.remaining_total = remaining;
    result.budget.pending_floor = floor_sum();
    result.budget.remaining_items = (candidates.size() - result.skipped.size()) + (plan.active() ? 1 : 0);
    return result;
}

AllocationResult BudgetAllocator::apply(QuestionPlan& plan, Duration active_elapsed,
                                        TimePoint now, TimePoint deadline) const {
    AllocationResult result = compute(plan, active_elapsed, now, deadline);

    for (const auto& id : result.skipped) {
        auto skipped = plan.skip(id, "budget");
        if (skipped.is_error()) {
            LOG_WARN("[Budget] " + skipped.error().to_string());
        }
    }
    for (const auto& entry : result.targets) {
        auto set = plan.set_target(entry.first, entry.second);
        if (set.is_error()) {
            LOG_WARN("[Budget] " + set.error().to_string());
        }
    }

    if (result.budget_exhausted) {
        LOG_WARN("[Budget] Minimums exceed remaining " +
                 utils::format_duration_ms(result.budget.remaining_total.count()) +
                 ", skipped " + std::to_string(result.skipped.size()) + " item(s)");
    }
    LOG_BUDGET("remaining=" + utils::format_duration_ms(result.budget.remaining_total.count()) +
               " items=" + std::to_string(result.budget.remaining_items) +
               " floor=" + utils::format_duration_ms(result.budget.pending_floor.count()));
    return result;
}

} // namespace viva
