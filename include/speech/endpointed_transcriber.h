#pragma once

#include "config.h"
#include "speech/end_of_turn_detector.h"
#include "speech/speech_interfaces.h"
#include <atomic>
#include <memory>

namespace viva {

/**
 * @brief ITranscriber that endpoints with EndOfTurnDetector and recognizes the segment
 *
 * Reads the source frame by frame until trailing silence, cut_off(), the
 * max-turn cap or disconnect, then runs the recognizer once on the captured
 * audio. No speech or a blank recognition yields the no-answer transcript.
 */
class EndpointedTranscriber : public ITranscriber {
public:
    EndpointedTranscriber(std::shared_ptr<ISpeechRecognizer> recognizer,
                          const VADConfig& vad_config,
                          const std::string& blank_sentinel,
                          int sample_rate = DEFAULT_SAMPLE_RATE);

    Result<TurnResult> transcribe(std::shared_ptr<IAudioSource> source,
                                  const CancellationToken& cancel) override;

    void cut_off() override { cutoff_requested_ = true; }

private:
    std::shared_ptr<ISpeechRecognizer> recognizer_;
    VADConfig vad_config_;
    std::string blank_sentinel_;
    int sample_rate_;
    std::atomic<bool> cutoff_requested_{false};
};

} // namespace viva
