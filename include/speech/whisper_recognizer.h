#pragma once

#include "config.h"
#include "speech/speech_interfaces.h"
#include <memory>

namespace viva {

/**
 * @brief whisper.cpp speech recognition
 *
 * Inference is serialized; one context is shared by all turns of a process.
 */
class WhisperRecognizer : public ISpeechRecognizer {
public:
    explicit WhisperRecognizer(const STTConfig& config);
    ~WhisperRecognizer();

    WhisperRecognizer(const WhisperRecognizer&) = delete;
    WhisperRecognizer& operator=(const WhisperRecognizer&) = delete;

    Result<Transcript> recognize(const AudioBuffer& audio) override;

    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
