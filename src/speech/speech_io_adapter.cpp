#include "speech/speech_io_adapter.h"
#include "async_call.h"
#include "logger.h"

namespace viva {

SpeechIOAdapter::SpeechIOAdapter(std::shared_ptr<ISpeechSynthesizer> synthesizer,
                                 std::shared_ptr<ITranscriber> transcriber,
                                 const TimeoutsConfig& timeouts)
    : synthesizer_(std::move(synthesizer)), transcriber_(std::move(transcriber)), timeouts_(timeouts) {}

AudioStreamPtr SpeechIOAdapter::synthesize(const std::string& text) {
    if (!synthesizer_) return nullptr;
    return synthesizer_->synthesize(text);
}

VoidResult SpeechIOAdapter::speak(const std::string& text, ChunkSink sink,
                                  const CancellationToken& cancel, Duration timeout) {
    if (!synthesizer_) {
        return make_io_error("no synthesizer");
    }
    if (timeout.count() == 0) timeout = synthesis_timeout();

    std::shared_ptr<IAudioStream> stream(synthesize(text));
    if (!stream) {
        return make_io_error("synthesizer returned no stream");
    }

    auto call = run_with_timeout<Error>(
        "synthesis",
        [stream, sink](const CancellationToken& token) {
            AudioChunk chunk;
            while (stream->next(chunk, token)) {
                if (token.is_cancelled()) break;
                if (sink) sink(chunk, stream->sample_rate());
            }
            return stream->error();
        },
        timeout, cancel);

    switch (call.status) {
        case CallStatus::Completed:
            if (call.value->is_error()) {
                LOG_TTS("Synthesis failed: " + call.value->to_string());
                return *call.value;
            }
            return VoidResult();
        case CallStatus::TimedOut:
            LOG_WARN("[TTS] " + call.error);
            return make_speech_timeout_error(call.error);
        case CallStatus::Cancelled:
            return make_cancelled_error("synthesis cancelled: " + call.error);
        case CallStatus::Failed:
            return make_io_error("synthesis threw: " + call.error);
    }
    return make_io_error("synthesis ended in an unknown state");
}

Result<TurnResult> SpeechIOAdapter::transcribe(std::shared_ptr<IAudioSource> source,
                                               const CancellationToken& cancel, Duration timeout) {
    if (!transcriber_) {
        return make_io_error("no transcriber");
    }
    if (timeout.count() == 0) timeout = transcription_timeout();

    auto transcriber = transcriber_;
    auto call = run_with_timeout<Result<TurnResult>>(
        "transcription",
        [transcriber, source](const CancellationToken& token) { return transcriber->transcribe(source, token); },
        timeout, cancel);

    switch (call.status) {
        case CallStatus::Completed:
            return *call.value;
        case CallStatus::TimedOut:
            LOG_WARN("[STT] " + call.error);
            return make_speech_timeout_error(call.error);
        case CallStatus::Cancelled:
            return make_cancelled_error("transcription cancelled: " + call.error);
        case CallStatus::Failed:
            return make_io_error("transcription threw: " + call.error);
    }
    return make_io_error("transcription ended in an unknown state");
}

void SpeechIOAdapter::cut_off() {
    if (transcriber_) transcriber_->cut_off();
}

} // namespace viva
