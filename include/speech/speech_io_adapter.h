#pragma once

#include "config.h"
#include "speech/speech_interfaces.h"
#include <functional>
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Uniform async front for synthesis and transcription
 *
 * Both calls run through run_with_timeout with the session token; a timeout
 * cancels the engine call and fails with SpeechTimeout, cancellation fails
 * with Cancelled.
 */
class SpeechIOAdapter {
public:
    /// Receives synthesized chunks; called from a worker thread.
    using ChunkSink = std::function<void(const AudioChunk& chunk, int sample_rate)>;

    SpeechIOAdapter(std::shared_ptr<ISpeechSynthesizer> synthesizer,
                    std::shared_ptr<ITranscriber> transcriber,
                    const TimeoutsConfig& timeouts);

    /// Fresh lazily-produced stream for text; each call gets its own.
    AudioStreamPtr synthesize(const std::string& text);

    /**
     * @brief Synthesize text and push every chunk into sink
     * @param timeout 0 = configured synthesis timeout
     */
    VoidResult speak(const std::string& text, ChunkSink sink,
                     const CancellationToken& cancel, Duration timeout = Duration(0));

    /**
     * @brief Capture and transcribe one candidate turn
     * @param timeout 0 = configured transcription timeout
     */
    Result<TurnResult> transcribe(std::shared_ptr<IAudioSource> source,
                                  const CancellationToken& cancel, Duration timeout = Duration(0));

    /// End the turn in progress now and transcribe what was captured.
    void cut_off();

    Duration synthesis_timeout() const { return Duration(timeouts_.synthesis_ms); }
    Duration transcription_timeout() const { return Duration(timeouts_.transcription_ms); }

private:
    std::shared_ptr<ISpeechSynthesizer> synthesizer_;
    std::shared_ptr<ITranscriber> transcriber_;
    TimeoutsConfig timeouts_;
};

} // namespace viva
