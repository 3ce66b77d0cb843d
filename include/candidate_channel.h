#pragma once

#include "common.h"
#include "cancellation.h"
#include "speech/speech_interfaces.h"
#include <functional>
#include <memory>
#include <string>

namespace viva {

/// Out-of-band requests from the candidate side.
enum class ControlSignal {
    Pause,
    Resume,
    Abort,
    EndOfTurn
};

inline const char* control_signal_name(ControlSignal signal) {
    switch (signal) {
        case ControlSignal::Pause:     return "pause";
        case ControlSignal::Resume:    return "resume";
        case ControlSignal::Abort:     return "abort";
        case ControlSignal::EndOfTurn: return "end_of_turn";
    }
    return "unknown";
}

/**
 * @brief Duplex link to the candidate
 *
 * Inbound: audio (IAudioSource) and control signals. Outbound: synthesized
 * audio and the text of everything the interviewer says. send_* never
 * block on playback; wait_output_drained() does.
 */
class ICandidateChannel : public IAudioSource {
public:
    using ControlHandler = std::function<void(ControlSignal)>;

    virtual void send_text(const std::string& text) = 0;
    virtual void send_audio(const AudioChunk& chunk, int sample_rate) = 0;

    /// Block until queued audio has played or the token is cancelled.
    virtual void wait_output_drained(const CancellationToken& cancel) = 0;

    /// Stop playback and drop queued audio.
    virtual void stop_output() = 0;

    /// Handler is invoked on the channel's thread.
    virtual void set_control_handler(ControlHandler handler) = 0;
};

using CandidateChannelPtr = std::shared_ptr<ICandidateChannel>;

} // namespace viva
