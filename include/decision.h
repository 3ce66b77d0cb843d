#pragma once

#include <string>
#include <variant>

namespace viva {

/// Answer accepted; move to the next item.
struct Advance {};

/// Ask the candidate one more probing question on the same item.
struct FollowUp {
    std::string text;
};

/// Move on regardless of answer quality (no time left, or no answer).
struct ForceAdvance {};

using Decision = std::variant<Advance, FollowUp, ForceAdvance>;

inline bool is_follow_up(const Decision& d) { return std::holds_alternative<FollowUp>(d); }
inline bool is_advance(const Decision& d) { return std::holds_alternative<Advance>(d); }
inline bool is_force_advance(const Decision& d) { return std::holds_alternative<ForceAdvance>(d); }

inline const char* decision_name(const Decision& d) {
    if (std::holds_alternative<Advance>(d)) return "advance";
    if (std::holds_alternative<FollowUp>(d)) return "follow_up";
    return "force_advance";
}

/// Follow-up text, or empty for the other alternatives.
inline std::string decision_text(const Decision& d) {
    if (const auto* f = std::get_if<FollowUp>(&d)) return f->text;
    return "";
}

} // namespace viva
