#pragma once

#include <string>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <vector>

namespace viva {

/**
 * @brief String utility functions
 */
namespace utils {

/**
 * @brief Trim whitespace from both ends of a string
 * @param str String to trim (modified in place)
 * @return Reference to the trimmed string
 */
inline std::string& trim(std::string& str) {
    str.erase(0, str.find_first_not_of(" \t\n\r"));
    str.erase(str.find_last_not_of(" \t\n\r") + 1);
    return str;
}

inline std::string trim_copy(const std::string& str) {
    std::string result = str;
    trim(result);
    return result;
}

/**
 * @brief Normalize string to lowercase
 * @param str String to normalize (modified in place)
 * @return Reference to the normalized string
 */
inline std::string& normalize(std::string& str) {
    std::transform(str.begin(), str.end(), str.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return str;
}

inline std::string normalize_copy(const std::string& str) {
    std::string result = str;
    normalize(result);
    return result;
}

inline bool is_empty_or_whitespace(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

/**
 * @brief Check if transcript text is blank (empty/whitespace, a sentinel, or transcribed noise)
 * @param text Raw transcript text
 * @param blank_sentinel Engine-specific blank marker (e.g. "[BLANK_AUDIO]"); compared after trim
 * @return True if the text carries no answer
 */
inline bool is_blank_transcript(const std::string& text, const std::string& blank_sentinel = "[BLANK_AUDIO]") {
    std::string t = trim_copy(text);
    if (t.empty()) return true;
    if (!blank_sentinel.empty() && t == blank_sentinel) return true;
    if (t == "[NO_ANSWER]") return true;

    std::string lower = normalize_copy(t);

    // Strip punctuation for pattern matching ("(silence)", "[inaudible]")
    std::string cleaned;
    for (char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c))) {
            cleaned += c;
        }
    }
    cleaned = trim_copy(cleaned);

    // Whole-transcript noise markers STT emits for silence or background sound
    static const std::vector<std::string> noise_patterns = {
        "silence", "noise", "inaudible", "background noise", "blank",
        "music", "static", "no speech", "nothing"
    };

    for (const auto& pattern : noise_patterns) {
        if (cleaned == pattern) {
            return true;
        }
    }

    return cleaned.empty();
}

/**
 * @brief Whole-word (or whole-phrase) case-insensitive containment
 * @param haystack Text to search
 * @param phrase Word or multi-word phrase
 * @return True if phrase occurs bounded by non-alphanumeric characters
 */
inline bool contains_phrase(const std::string& haystack, const std::string& phrase) {
    std::string normalized = normalize_copy(haystack);
    std::string pattern = normalize_copy(trim_copy(phrase));
    if (pattern.empty()) return false;

    size_t pos = normalized.find(pattern);
    while (pos != std::string::npos) {
        bool start_ok = (pos == 0 || !std::isalnum(static_cast<unsigned char>(normalized[pos - 1])));
        size_t end_pos = pos + pattern.length();
        bool end_ok = (end_pos >= normalized.length() ||
                       !std::isalnum(static_cast<unsigned char>(normalized[end_pos])));
        if (start_ok && end_ok) {
            return true;
        }
        pos = normalized.find(pattern, pos + 1);
    }
    return false;
}

/**
 * @brief Render milliseconds as "12m05s" / "850ms" for logs
 */
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) return "-" + format_duration_ms(-ms);
    if (ms < 1000) return std::to_string(ms) + "ms";
    int64_t total_s = ms / 1000;
    int64_t m = total_s / 60;
    int64_t s = total_s % 60;
    std::string sec = (s < 10 ? "0" : "") + std::to_string(s) + "s";
    if (m == 0) return std::to_string(s) + "s";
    return std::to_string(m) + "m" + sec;
}

} // namespace utils

} // namespace viva
