#pragma once

#include "common.h"
#include "config.h"
#include <memory>

namespace viva {

enum class TurnEvent {
    None,
    SpeechStart,
    EndOfTurn
};

/**
 * @brief Energy-based trailing-silence endpointer
 *
 * Speech starts after start_frames_required consecutive frames above the
 * adaptive threshold; the turn ends after end_of_turn_silence_ms of frames
 * without clear speech. Bursts shorter than min_speech_ms are dropped and
 * the detector goes back to waiting.
 */
class EndOfTurnDetector {
public:
    explicit EndOfTurnDetector(const VADConfig& config, int sample_rate = DEFAULT_SAMPLE_RATE);
    ~EndOfTurnDetector();

    TurnEvent process(const AudioChunk& frame);

    bool in_speech() const;

    /// Audio captured since SpeechStart.
    const AudioBuffer& segment() const;

    /// Return and clear the captured segment.
    AudioBuffer take_segment();

    int64_t segment_ms() const;

    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
