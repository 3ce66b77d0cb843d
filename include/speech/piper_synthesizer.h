#pragma once

#include "config.h"
#include "speech/speech_interfaces.h"
#include <string>

namespace viva {

/**
 * @brief Text-to-speech through the Piper executable
 *
 * Each synthesize() call returns a stream that launches its own piper
 * process on first read and forwards raw PCM as it is produced, resampled
 * to the session rate. Abandoning or cancelling a stream kills its process.
 */
class PiperSynthesizer : public ISpeechSynthesizer {
public:
    explicit PiperSynthesizer(const TTSConfig& config, int sample_rate = DEFAULT_SAMPLE_RATE);

    AudioStreamPtr synthesize(const std::string& text) override;

    bool is_ready() const { return !piper_path_.empty(); }

    const std::string& piper_path() const { return piper_path_; }

private:
    void find_piper_path();

    TTSConfig config_;
    int sample_rate_;
    std::string piper_path_;
    std::string espeak_data_;
};

} // namespace viva
