#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>

namespace viva {

// Audio types
using Sample = int16_t;
using AudioChunk = std::vector<Sample>;
using AudioBuffer = std::vector<Sample>;

// Timing
using TimePoint = std::chrono::steady_clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_between(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<Duration>(to - from).count();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;
constexpr int FRAME_SIZE_MS = 20;
constexpr int SAMPLES_PER_FRAME = (DEFAULT_SAMPLE_RATE * FRAME_SIZE_MS) / 1000; // 320 samples @ 16kHz

// Transcript emitted when the listening window produced no usable answer
// (transcription timeout, silence, or a deadline cutoff).
constexpr const char* NO_ANSWER_SENTINEL = "[NO_ANSWER]";

// Transcript result
struct Transcript {
    std::string text;
    float confidence = 0.0f;
    int64_t processing_ms = 0;
    int token_count = 0;  ///< Number of tokens from STT (0 if not set)

    bool is_no_answer() const { return text == NO_ANSWER_SENTINEL; }

    static Transcript no_answer() {
        Transcript t;
        t.text = NO_ANSWER_SENTINEL;
        return t;
    }
};

} // namespace viva
