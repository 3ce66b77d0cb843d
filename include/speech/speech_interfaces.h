#pragma once

#include "cancellation.h"
#include "common.h"
#include "errors.h"
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Synthesized audio produced on demand
 *
 * A stream belongs to one synthesize() call and is drained once.
 */
class IAudioStream {
public:
    virtual ~IAudioStream() = default;

    /**
     * @brief Produce the next chunk
     * @return false when the stream is finished (check error() for failure)
     */
    virtual bool next(AudioChunk& chunk, const CancellationToken& cancel) = 0;

    virtual int sample_rate() const = 0;

    /// Error that ended the stream early; type None after a normal end.
    virtual Error error() const = 0;
};

using AudioStreamPtr = std::unique_ptr<IAudioStream>;

class ISpeechSynthesizer {
public:
    virtual ~ISpeechSynthesizer() = default;

    /// Lazily produced audio for text. Nothing runs until the first next().
    virtual AudioStreamPtr synthesize(const std::string& text) = 0;
};

/**
 * @brief Source of the candidate's audio
 */
class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    /**
     * @brief Wait up to `wait` for captured audio
     * @return false if nothing arrived in time
     */
    virtual bool read_audio(AudioChunk& chunk, Duration wait) = 0;

    /// False once the candidate is gone; no more audio will arrive.
    virtual bool is_open() const = 0;

    /// Drop audio captured before the listening window opened.
    virtual void discard_pending() = 0;
};

/// Turns one complete audio segment into text (whisper or a test double).
class ISpeechRecognizer {
public:
    virtual ~ISpeechRecognizer() = default;
    virtual Result<Transcript> recognize(const AudioBuffer& audio) = 0;
};

enum class EndOfTurn {
    Silence,       ///< Trailing silence after speech
    Cutoff,        ///< cut_off() called
    MaxDuration,   ///< Answer hit the configured cap
    SourceClosed   ///< Candidate disconnected
};

const char* end_of_turn_name(EndOfTurn reason);

struct TurnResult {
    Transcript transcript;
    EndOfTurn reason = EndOfTurn::Silence;
    Duration speech{0};    ///< Captured audio length
};

/**
 * @brief Streaming transcription of one candidate turn
 *
 * transcribe() blocks until end-of-turn and may be abandoned through the
 * token. cut_off() may be called from any thread.
 */
class ITranscriber {
public:
    virtual ~ITranscriber() = default;

    virtual Result<TurnResult> transcribe(std::shared_ptr<IAudioSource> source,
                                          const CancellationToken& cancel) = 0;

    virtual void cut_off() = 0;
};

} // namespace viva
