#include "question_plan.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <set>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace viva {

const char* item_status_name(ItemStatus status) {
    switch (status) {
        case ItemStatus::Pending:  return "pending";
        case ItemStatus::Active:   return "active";
        case ItemStatus::Answered: return "answered";
        case ItemStatus::Skipped:  return "skipped";
    }
    return "unknown";
}

const char* question_type_name(QuestionType type) {
    switch (type) {
        case QuestionType::Behavioral:  return "behavioral";
        case QuestionType::Technical:   return "technical";
        case QuestionType::Situational: return "situational";
        case QuestionType::Cultural:    return "cultural";
    }
    return "technical";
}

QuestionType parse_question_type(const std::string& name) {
    std::string n = utils::normalize_copy(utils::trim_copy(name));
    if (n == "behavioral" || n == "behavioural") return QuestionType::Behavioral;
    if (n == "situational") return QuestionType::Situational;
    if (n == "cultural") return QuestionType::Cultural;
    return QuestionType::Technical;
}

QuestionPlan::QuestionPlan(std::vector<PlanItem> items) : items_(std::move(items)) {}

namespace {

/// Text, time and weight checks shared by validate() and append().
VoidResult check_item(const PlanItem& item, const std::string& where) {
    if (utils::is_empty_or_whitespace(item.text)) {
        return make_invalid_plan_error(where + " has no question text");
    }
    if (item.min_time.count() < 0 || item.target_time.count() < 0 || item.max_time.count() < 0) {
        return make_invalid_plan_error(where + " has a negative time");
    }
    if (item.min_time > item.max_time) {
        return make_invalid_plan_error(where + " minimum " + utils::format_duration_ms(item.min_time.count()) +
                                       " exceeds maximum " + utils::format_duration_ms(item.max_time.count()));
    }
    if (item.weight <= 0.0) {
        return make_invalid_plan_error(where + " has non-positive weight");
    }
    return VoidResult();
}

} // namespace

VoidResult QuestionPlan::validate() const {
    if (items_.empty()) {
        return make_invalid_plan_error("plan has no items");
    }
    std::set<std::string> ids;
    for (size_t i = 0; i < items_.size(); ++i) {
        const auto& item = items_[i];
        std::string where = "item " + std::to_string(i) + " (" + item.id + ")";
        if (item.id.empty()) {
            return make_invalid_plan_error("item " + std::to_string(i) + " has no id");
        }
        if (!ids.insert(item.id).second) {
            return make_invalid_plan_error("duplicate item id: " + item.id);
        }
        auto checked = check_item(item, where);
        if (checked.is_error()) {
            return checked;
        }
    }
    if (count(ItemStatus::Active) > 1) {
        return make_invalid_plan_error("more than one active item");
    }
    return VoidResult();
}

VoidResult QuestionPlan::append(PlanItem item) {
    if (item.id.empty()) {
        return make_invalid_plan_error("cannot append item without id");
    }
    if (find(item.id)) {
        return make_invalid_plan_error("duplicate item id: " + item.id);
    }
    auto checked = check_item(item, "appended item (" + item.id + ")");
    if (checked.is_error()) {
        return checked;
    }
    item.target_time = std::max(item.min_time, std::min(item.target_time, item.max_time));
    item.status = ItemStatus::Pending;
    items_.push_back(std::move(item));
    return VoidResult();
}

VoidResult QuestionPlan::remove(const std::string& id) {
    auto it = find_it(id);
    if (it == items_.end()) {
        return make_invalid_state_error("no item " + id);
    }
    if (it->is_active()) {
        return make_invalid_state_error("cannot remove active item " + id);
    }
    items_.erase(it);
    return VoidResult();
}

VoidResult QuestionPlan::reorder(const std::string& id, size_t new_index) {
    auto it = find_it(id);
    if (it == items_.end()) {
        return make_invalid_state_error("no item " + id);
    }
    if (it->is_active()) {
        return make_invalid_state_error("cannot move active item " + id);
    }
    if (new_index >= items_.size()) {
        new_index = items_.size() - 1;
    }
    PlanItem moved = std::move(*it);
    items_.erase(it);
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(new_index), std::move(moved));
    return VoidResult();
}

PlanItem* QuestionPlan::activate_next() {
    if (active()) {
        return nullptr;
    }
    for (auto& item : items_) {
        if (item.is_pending()) {
            item.status = ItemStatus::Active;
            return &item;
        }
    }
    return nullptr;
}

PlanItem* QuestionPlan::active() {
    for (auto& item : items_) {
        if (item.is_active()) return &item;
    }
    return nullptr;
}

const PlanItem* QuestionPlan::active() const {
    for (const auto& item : items_) {
        if (item.is_active()) return &item;
    }
    return nullptr;
}

PlanItem* QuestionPlan::find(const std::string& id) {
    auto it = find_it(id);
    return it == items_.end() ? nullptr : &*it;
}

const PlanItem* QuestionPlan::find(const std::string& id) const {
    for (const auto& item : items_) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

VoidResult QuestionPlan::finish_active(ItemStatus final_status, const std::string& reason) {
    if (final_status != ItemStatus::Answered && final_status != ItemStatus::Skipped) {
        return make_invalid_state_error("active item can only finish as answered or skipped");
    }
    PlanItem* item = active();
    if (!item) {
        return make_invalid_state_error("no active item");
    }
    item->status = final_status;
    if (final_status == ItemStatus::Skipped) {
        item->skip_reason = reason;
    }
    return VoidResult();
}

VoidResult QuestionPlan::skip(const std::string& id, const std::string& reason) {
    PlanItem* item = find(id);
    if (!item) {
        return make_invalid_state_error("no item " + id);
    }
    if (!item->is_pending()) {
        return make_invalid_state_error("item " + id + " is " + item_status_name(item->status) + ", not pending");
    }
    item->status = ItemStatus::Skipped;
    item->skip_reason = reason;
    return VoidResult();
}

VoidResult QuestionPlan::set_target(const std::string& id, Duration target) {
    PlanItem* item = find(id);
    if (!item) {
        return make_invalid_state_error("no item " + id);
    }
    item->target_time = std::max(item->min_time, std::min(target, item->max_time));
    return VoidResult();
}

std::vector<const PlanItem*> QuestionPlan::pending() const {
    std::vector<const PlanItem*> result;
    for (const auto& item : items_) {
        if (item.is_pending()) result.push_back(&item);
    }
    return result;
}

size_t QuestionPlan::pending_count() const {
    return count(ItemStatus::Pending);
}

Duration QuestionPlan::pending_minimum_sum() const {
    Duration sum{0};
    for (const auto& item : items_) {
        if (item.is_pending()) sum += item.min_time;
    }
    return sum;
}

size_t QuestionPlan::count(ItemStatus status) const {
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
                                             [status](const PlanItem& item) { return item.status == status; }));
}

std::vector<PlanItem>::iterator QuestionPlan::find_it(const std::string& id) {
    return std::find_if(items_.begin(), items_.end(), [&id](const PlanItem& item) { return item.id == id; });
}

namespace {

Duration seconds_field(const json& j, const char* key, int fallback_s) {
    if (j.contains(key) && j[key].is_number()) {
        return Duration(static_cast<int64_t>(j[key].get<double>() * 1000.0));
    }
    return Duration(static_cast<int64_t>(fallback_s) * 1000);
}

} // namespace

Result<QuestionPlan> plan_from_json(const json& j, const PlanDefaultsConfig& defaults) {
    const json* items_json = nullptr;
    if (j.is_array()) {
        items_json = &j;
    } else if (j.is_object() && j.contains("items") && j["items"].is_array()) {
        items_json = &j["items"];
    } else {
        return make_parse_error("plan JSON must be an array or an object with an \"items\" array");
    }

    std::vector<PlanItem> items;
    try {
        size_t index = 0;
        for (const auto& entry : *items_json) {
            if (!entry.is_object()) {
                return make_parse_error("plan item " + std::to_string(index) + " is not an object");
            }
            PlanItem item;
            item.id = entry.contains("id") ? entry["id"].get<std::string>() : "q" + std::to_string(index + 1);
            if (entry.contains("text")) item.text = entry["text"].get<std::string>();
            else if (entry.contains("question")) item.text = entry["question"].get<std::string>();
            if (entry.contains("type") && entry["type"].is_string())
                item.type = parse_question_type(entry["type"].get<std::string>());
            if (entry.contains("rubric") && entry["rubric"].is_object()) {
                const auto& r = entry["rubric"];
                if (r.contains("keywords") && r["keywords"].is_array()) {
                    for (const auto& kw : r["keywords"])
                        if (kw.is_string()) item.rubric.keywords.push_back(kw.get<std::string>());
                }
                if (r.contains("reference") && r["reference"].is_string())
                    item.rubric.reference = r["reference"].get<std::string>();
            }
            item.min_time = seconds_field(entry, "min_s", defaults.min_s);
            item.max_time = seconds_field(entry, "max_s", defaults.max_s);
            item.target_time = seconds_field(entry, "target_s", defaults.target_s);
            if (item.min_time <= item.max_time) {
                item.target_time = std::max(item.min_time, std::min(item.target_time, item.max_time));
            }
            item.weight = (entry.contains("weight") && entry["weight"].is_number())
                ? entry["weight"].get<double>() : defaults.weight;
            items.push_back(std::move(item));
            ++index;
        }
    } catch (const json::exception& e) {
        return make_parse_error(std::string("plan JSON: ") + e.what());
    }

    LOG_PLAN("Parsed plan with " + std::to_string(items.size()) + " items");
    return QuestionPlan(std::move(items));
}

json plan_item_to_json(const PlanItem& item) {
    json j;
    j["id"] = item.id;
    j["text"] = item.text;
    j["type"] = question_type_name(item.type);
    j["rubric"]["keywords"] = item.rubric.keywords;
    if (!item.rubric.reference.empty()) j["rubric"]["reference"] = item.rubric.reference;
    j["min_s"] = item.min_time.count() / 1000.0;
    j["target_s"] = item.target_time.count() / 1000.0;
    j["max_s"] = item.max_time.count() / 1000.0;
    j["weight"] = item.weight;
    j["status"] = item_status_name(item.status);
    j["followups_issued"] = item.followups_issued;
    j["time_spent_ms"] = item.time_spent.count();
    if (!item.skip_reason.empty()) j["skip_reason"] = item.skip_reason;
    return j;
}

json plan_to_json(const QuestionPlan& plan) {
    json j;
    j["items"] = json::array();
    for (const auto& item : plan.items()) {
        j["items"].push_back(plan_item_to_json(item));
    }
    return j;
}

} // namespace viva
