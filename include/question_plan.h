#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace viva {

enum class ItemStatus {
    Pending,
    Active,
    Answered,
    Skipped
};

enum class QuestionType {
    Behavioral,
    Technical,
    Situational,
    Cultural
};

const char* item_status_name(ItemStatus status);
const char* question_type_name(QuestionType type);
/// Unknown names map to Technical.
QuestionType parse_question_type(const std::string& name);

/**
 * @brief What a complete answer is expected to contain
 *
 * Scorers read it; the orchestrator only carries it.
 */
struct Rubric {
    std::vector<std::string> keywords;  ///< Points the answer should mention
    std::string reference;              ///< Free-text expected answer or rubric id
};

/**
 * @brief One topic/question with its time budget
 */
struct PlanItem {
    std::string id;
    std::string text;
    QuestionType type = QuestionType::Technical;
    Rubric rubric;

    Duration min_time{0};
    Duration target_time{0};
    Duration max_time{0};
    double weight = 1.0;

    ItemStatus status = ItemStatus::Pending;
    int followups_issued = 0;
    Duration time_spent{0};     ///< Accumulated over all rounds of this item
    std::string skip_reason;

    bool is_pending() const { return status == ItemStatus::Pending; }
    bool is_active() const { return status == ItemStatus::Active; }
    bool is_finished() const { return status == ItemStatus::Answered || status == ItemStatus::Skipped; }
};

/**
 * @brief Ordered, mutable interview plan
 *
 * Invariant: at most one item is Active. The active item can be neither
 * removed nor moved.
 */
class QuestionPlan {
public:
    QuestionPlan() = default;
    explicit QuestionPlan(std::vector<PlanItem> items);

    /// InvalidPlan if empty, an item has min > max, negative times,
    /// non-positive weight, empty text, or duplicate/empty ids.
    VoidResult validate() const;

    VoidResult append(PlanItem item);
    VoidResult remove(const std::string& id);
    VoidResult reorder(const std::string& id, size_t new_index);

    /// Mark the first pending item active. nullptr if none pending or one is already active.
    PlanItem* activate_next();

    PlanItem* active();
    const PlanItem* active() const;

    PlanItem* find(const std::string& id);
    const PlanItem* find(const std::string& id) const;

    /// Active → Answered/Skipped.
    VoidResult finish_active(ItemStatus final_status, const std::string& reason = "");

    /// Pending → Skipped.
    VoidResult skip(const std::string& id, const std::string& reason);

    VoidResult set_target(const std::string& id, Duration target);

    std::vector<const PlanItem*> pending() const;
    size_t pending_count() const;
    Duration pending_minimum_sum() const;
    size_t count(ItemStatus status) const;

    const std::vector<PlanItem>& items() const { return items_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

private:
    std::vector<PlanItem>::iterator find_it(const std::string& id);

    std::vector<PlanItem> items_;
};

/**
 * @brief Build a plan from the matching subsystem's JSON
 *
 * Accepts {"items": [...]} or a bare array. Times are in seconds
 * ("min_s", "target_s", "max_s"); missing fields come from defaults.
 * Targets outside [min, max] are clamped. Validation is left to the caller.
 */
Result<QuestionPlan> plan_from_json(const nlohmann::json& j, const PlanDefaultsConfig& defaults);

nlohmann::json plan_to_json(const QuestionPlan& plan);
nlohmann::json plan_item_to_json(const PlanItem& item);

} // namespace viva
