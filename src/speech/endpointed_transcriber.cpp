#include "speech/endpointed_transcriber.h"
#include "logger.h"
#include "utils.h"

namespace viva {

const char* end_of_turn_name(EndOfTurn reason) {
    switch (reason) {
        case EndOfTurn::Silence:      return "silence";
        case EndOfTurn::Cutoff:       return "cutoff";
        case EndOfTurn::MaxDuration:  return "max_duration";
        case EndOfTurn::SourceClosed: return "source_closed";
    }
    return "unknown";
}

EndpointedTranscriber::EndpointedTranscriber(std::shared_ptr<ISpeechRecognizer> recognizer,
                                             const VADConfig& vad_config,
                                             const std::string& blank_sentinel,
                                             int sample_rate)
    : recognizer_(std::move(recognizer)),
      vad_config_(vad_config),
      blank_sentinel_(blank_sentinel),
      sample_rate_(sample_rate) {}

Result<TurnResult> EndpointedTranscriber::transcribe(std::shared_ptr<IAudioSource> source,
                                                     const CancellationToken& cancel) {
    if (!source) {
        return make_io_error("no audio source");
    }

    // One detector per turn so a turn abandoned on timeout never shares state
    EndOfTurnDetector detector(vad_config_, sample_rate_);
    const size_t frame_samples = static_cast<size_t>(sample_rate_ * FRAME_SIZE_MS / 1000);
    cutoff_requested_ = false;
    source->discard_pending();

    TurnResult result;
    bool ended = false;
    AudioChunk pending;
    AudioChunk chunk;

    while (!ended) {
        if (cancel.is_cancelled()) {
            return make_cancelled_error("transcription cancelled: " + cancel.reason());
        }
        if (cutoff_requested_.exchange(false)) {
            result.reason = EndOfTurn::Cutoff;
            break;
        }
        if (!source->read_audio(chunk, Duration(FRAME_SIZE_MS))) {
            if (!source->is_open()) {
                result.reason = EndOfTurn::SourceClosed;
                break;
            }
            continue;
        }
        pending.insert(pending.end(), chunk.begin(), chunk.end());

        size_t offset = 0;
        while (pending.size() - offset >= frame_samples) {
            AudioChunk frame(pending.begin() + static_cast<std::ptrdiff_t>(offset),
                             pending.begin() + static_cast<std::ptrdiff_t>(offset + frame_samples));
            offset += frame_samples;
            if (detector.process(frame) == TurnEvent::EndOfTurn) {
                result.reason = (vad_config_.max_turn_ms > 0 && detector.segment_ms() >= vad_config_.max_turn_ms)
                    ? EndOfTurn::MaxDuration : EndOfTurn::Silence;
                ended = true;
                break;
            }
        }
        pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(offset));
    }

    AudioBuffer segment = detector.take_segment();
    result.speech = Duration(static_cast<int64_t>(segment.size()) * 1000 / sample_rate_);
    if (segment.empty()) {
        LOG_STT("Turn ended (" + std::string(end_of_turn_name(result.reason)) + ") without speech");
        result.transcript = Transcript::no_answer();
        return result;
    }

    auto recognized = recognizer_->recognize(segment);
    if (recognized.is_error()) {
        return recognized.error();
    }
    if (cancel.is_cancelled()) {
        return make_cancelled_error("transcription cancelled: " + cancel.reason());
    }

    result.transcript = recognized.value();
    if (utils::is_blank_transcript(result.transcript.text, blank_sentinel_)) {
        LOG_STT("Blank transcript, treating as no answer");
        int64_t processing_ms = result.transcript.processing_ms;
        result.transcript = Transcript::no_answer();
        result.transcript.processing_ms = processing_ms;
    } else {
        utils::trim(result.transcript.text);
        LOG_STT("\"" + result.transcript.text + "\" (" + end_of_turn_name(result.reason) + ", " +
                std::to_string(result.transcript.processing_ms) + "ms)");
    }
    return result;
}

} // namespace viva
