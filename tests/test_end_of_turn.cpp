/**
 * End-of-turn detection and the endpointed transcriber built on it.
 * Audio is synthetic: constant-amplitude frames for speech, zeros for silence.
 *
 * Run from build dir: ./test_end_of_turn
 */

#include "fakes.h"
#include "speech/end_of_turn_detector.h"
#include "speech/endpointed_transcriber.h"
#include <deque>
#include <iostream>
#include <mutex>
#include <string>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static AudioChunk loud() { return AudioChunk(SAMPLES_PER_FRAME, 8000); }
static AudioChunk quiet() { return AudioChunk(SAMPLES_PER_FRAME, 0); }

static VADConfig vad() {
    VADConfig config;
    config.threshold = 0.02f;
    config.start_frames_required = 2;
    config.end_of_turn_silence_ms = 1500;  // 75 frames
    config.min_speech_ms = 300;            // 15 frames
    config.max_turn_ms = 0;
    return config;
}

static void test_detects_turn() {
    EndOfTurnDetector detector(vad());
    for (int i = 0; i < 10; ++i) ASSERT(detector.process(quiet()) == TurnEvent::None);

    ASSERT(detector.process(loud()) == TurnEvent::None);
    ASSERT(detector.process(loud()) == TurnEvent::SpeechStart);
    ASSERT(detector.in_speech());
    for (int i = 0; i < 30; ++i) detector.process(loud());

    TurnEvent last = TurnEvent::None;
    int silent_frames = 0;
    while (last != TurnEvent::EndOfTurn && silent_frames < 200) {
        last = detector.process(quiet());
        ++silent_frames;
    }
    ASSERT(last == TurnEvent::EndOfTurn);
    ASSERT(silent_frames == 75);
    ASSERT(!detector.in_speech());
    ASSERT(detector.segment_ms() == (1 + 30 + 75) * FRAME_SIZE_MS);

    AudioBuffer segment = detector.take_segment();
    ASSERT(segment.size() == static_cast<size_t>((1 + 30 + 75) * SAMPLES_PER_FRAME));
    ASSERT(detector.segment().empty());
}

static void test_drops_short_burst() {
    EndOfTurnDetector detector(vad());
    for (int i = 0; i < 5; ++i) detector.process(quiet());
    for (int i = 0; i < 5; ++i) detector.process(loud());
    ASSERT(detector.in_speech());

    bool ended = false;
    for (int i = 0; i < 100; ++i) {
        if (detector.process(quiet()) == TurnEvent::EndOfTurn) ended = true;
    }
    ASSERT(!ended);
    ASSERT(!detector.in_speech());
    ASSERT(detector.segment().empty());
}

static void test_max_turn() {
    VADConfig config = vad();
    config.max_turn_ms = 1000;
    EndOfTurnDetector detector(config);
    detector.process(quiet());

    int frames = 0;
    TurnEvent last = TurnEvent::None;
    while (last != TurnEvent::EndOfTurn && frames < 200) {
        last = detector.process(loud());
        ++frames;
    }
    ASSERT(last == TurnEvent::EndOfTurn);
    ASSERT(detector.segment_ms() == 1000);
}

/// Replays queued frames; closes or cuts off the turn when the queue runs dry.
class ScriptedSource : public IAudioSource {
public:
    enum class WhenDry { Wait, Close, CutOff };

    ScriptedSource(std::vector<AudioChunk> frames, WhenDry when_dry)
        : frames_(frames.begin(), frames.end()), when_dry_(when_dry) {}

    void attach(ITranscriber* transcriber) { transcriber_ = transcriber; }

    bool read_audio(AudioChunk& chunk, Duration) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (frames_.empty()) {
            if (when_dry_ == WhenDry::Close) open_ = false;
            if (when_dry_ == WhenDry::CutOff && transcriber_) transcriber_->cut_off();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            return false;
        }
        chunk = frames_.front();
        frames_.pop_front();
        return true;
    }

    bool is_open() const override { return open_; }
    void discard_pending() override { ++discards_; }

    int discards() const { return discards_; }

private:
    std::mutex mutex_;
    std::deque<AudioChunk> frames_;
    WhenDry when_dry_;
    ITranscriber* transcriber_ = nullptr;
    std::atomic<bool> open_{true};
    std::atomic<int> discards_{0};
};

class FixedRecognizer : public ISpeechRecognizer {
public:
    explicit FixedRecognizer(std::string text) : text_(std::move(text)) {}

    Result<Transcript> recognize(const AudioBuffer& audio) override {
        ++calls_;
        last_size_ = audio.size();
        Transcript t;
        t.text = text_;
        t.confidence = 0.8f;
        t.processing_ms = 12;
        return t;
    }

    int calls() const { return calls_; }
    size_t last_size() const { return last_size_; }

private:
    std::string text_;
    std::atomic<int> calls_{0};
    std::atomic<size_t> last_size_{0};
};

static std::vector<AudioChunk> answer_frames(int speech, int silence) {
    std::vector<AudioChunk> frames;
    for (int i = 0; i < 5; ++i) frames.push_back(quiet());
    for (int i = 0; i < speech; ++i) frames.push_back(loud());
    for (int i = 0; i < silence; ++i) frames.push_back(quiet());
    return frames;
}

static void test_transcribes_on_silence() {
    auto recognizer = std::make_shared<FixedRecognizer>("  I would add a read replica.  ");
    EndpointedTranscriber transcriber(recognizer, vad(), "[BLANK_AUDIO]");
    auto source = std::make_shared<ScriptedSource>(answer_frames(40, 80), ScriptedSource::WhenDry::Close);

    CancellationSource turn;
    auto result = transcriber.transcribe(source, turn.token());
    ASSERT(result.is_ok());
    ASSERT(result.value().reason == EndOfTurn::Silence);
    ASSERT(result.value().transcript.text == "I would add a read replica.");
    ASSERT(result.value().speech.count() > 0);
    ASSERT(recognizer->calls() == 1);
    ASSERT(source->discards() == 1);
}

static void test_silence_only_is_no_answer() {
    auto recognizer = std::make_shared<FixedRecognizer>("never used");
    EndpointedTranscriber transcriber(recognizer, vad(), "[BLANK_AUDIO]");
    auto source = std::make_shared<ScriptedSource>(answer_frames(0, 50), ScriptedSource::WhenDry::Close);

    CancellationSource turn;
    auto result = transcriber.transcribe(source, turn.token());
    ASSERT(result.is_ok());
    ASSERT(result.value().reason == EndOfTurn::SourceClosed);
    ASSERT(result.value().transcript.is_no_answer());
    ASSERT(recognizer->calls() == 0);
}

static void test_blank_recognition_is_no_answer() {
    auto recognizer = std::make_shared<FixedRecognizer>("[BLANK_AUDIO]");
    EndpointedTranscriber transcriber(recognizer, vad(), "[BLANK_AUDIO]");
    auto source = std::make_shared<ScriptedSource>(answer_frames(40, 80), ScriptedSource::WhenDry::Close);

    CancellationSource turn;
    auto result = transcriber.transcribe(source, turn.token());
    ASSERT(result.is_ok());
    ASSERT(result.value().transcript.is_no_answer());
    ASSERT(result.value().transcript.processing_ms == 12);
}

static void test_cut_off_mid_answer() {
    auto recognizer = std::make_shared<FixedRecognizer>("partial answer");
    EndpointedTranscriber transcriber(recognizer, vad(), "[BLANK_AUDIO]");
    // Speech still running when the queue runs dry: only cut_off() ends the turn
    auto source = std::make_shared<ScriptedSource>(answer_frames(40, 0), ScriptedSource::WhenDry::CutOff);
    source->attach(&transcriber);

    CancellationSource turn;
    auto result = transcriber.transcribe(source, turn.token());
    ASSERT(result.is_ok());
    ASSERT(result.value().reason == EndOfTurn::Cutoff);
    ASSERT(result.value().transcript.text == "partial answer");
    ASSERT(recognizer->last_size() == static_cast<size_t>(39 * SAMPLES_PER_FRAME));
}

static void test_cancelled_turn() {
    auto recognizer = std::make_shared<FixedRecognizer>("x");
    EndpointedTranscriber transcriber(recognizer, vad(), "[BLANK_AUDIO]");
    auto source = std::make_shared<ScriptedSource>(answer_frames(0, 0), ScriptedSource::WhenDry::Wait);

    CancellationSource turn;
    std::thread deadline([turn]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        turn.cancel("deadline");
    });
    auto result = transcriber.transcribe(source, turn.token());
    deadline.join();
    ASSERT(result.is_error());
    ASSERT(result.error().type == ErrorType::Cancelled);
}

int main() {
    test_detects_turn();
    test_drops_short_burst();
    test_max_turn();
    test_transcribes_on_silence();
    test_silence_only_is_no_answer();
    test_blank_recognition_is_no_answer();
    test_cut_off_mid_answer();
    test_cancelled_turn();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All end-of-turn tests passed.\n";
    return 0;
}
