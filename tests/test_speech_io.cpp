/**
 * Speech I/O adapter: streamed synthesis and transcription under per-call
 * timeouts and turn cancellation.
 *
 * Run from build dir: ./test_speech_io
 */

#include "fakes.h"
#include "speech/speech_io_adapter.h"
#include <atomic>
#include <iostream>
#include <string>

using namespace viva;
using namespace viva::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static TimeoutsConfig short_timeouts() {
    TimeoutsConfig timeouts;
    timeouts.synthesis_ms = 200;
    timeouts.transcription_ms = 200;
    timeouts.scoring_ms = 200;
    return timeouts;
}

static void test_speak_streams_chunks() {
    auto synth = std::make_shared<FakeSynthesizer>(FakeStream::Mode::Normal, 3);
    SpeechIOAdapter speech(synth, nullptr, short_timeouts());

    std::atomic<int> chunks{0};
    CancellationSource turn;
    auto spoken = speech.speak("Tell me about yourself.", [&chunks](const AudioChunk& chunk, int rate) {
        if (chunk.size() == static_cast<size_t>(SAMPLES_PER_FRAME) && rate == DEFAULT_SAMPLE_RATE) chunks++;
    }, turn.token());
    ASSERT(spoken.is_ok());
    ASSERT(chunks == 3);
    ASSERT(synth->texts().size() == 1);
    ASSERT(synth->texts()[0] == "Tell me about yourself.");

    // Streams are lazy and independent
    auto a = speech.synthesize("one");
    auto b = speech.synthesize("two");
    ASSERT(a && b && a.get() != b.get());
}

static void test_speak_failures() {
    CancellationSource turn;

    SpeechIOAdapter hanging(std::make_shared<FakeSynthesizer>(FakeStream::Mode::Hang), nullptr, short_timeouts());
    auto timed_out = hanging.speak("Hello", nullptr, turn.token());
    ASSERT(timed_out.is_error());
    ASSERT(timed_out.error().type == ErrorType::SpeechTimeout);

    SpeechIOAdapter broken(std::make_shared<FakeSynthesizer>(FakeStream::Mode::Fail), nullptr, short_timeouts());
    auto crashed = broken.speak("Hello", nullptr, turn.token());
    ASSERT(crashed.is_error());
    ASSERT(crashed.error().type == ErrorType::IOError);

    SpeechIOAdapter silent(nullptr, nullptr, short_timeouts());
    ASSERT(silent.speak("Hello", nullptr, turn.token()).is_error());

    CancellationSource deadline;
    std::thread fire([deadline]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        deadline.cancel("deadline");
    });
    auto cancelled = hanging.speak("Hello", nullptr, deadline.token(), Duration(5000));
    fire.join();
    ASSERT(cancelled.is_error());
    ASSERT(cancelled.error().type == ErrorType::Cancelled);
}

static void test_transcribe() {
    ManualClock clock;
    auto transcriber = std::make_shared<FakeTranscriber>(&clock, std::vector<ScriptedTurn>{
        ScriptedTurn::answer("I led the migration.", minutes(2)),
        ScriptedTurn::hangs(),
    });
    SpeechIOAdapter speech(nullptr, transcriber, short_timeouts());
    auto channel = std::make_shared<FakeChannel>();
    CancellationSource turn;

    auto answered = speech.transcribe(channel, turn.token());
    ASSERT(answered.is_ok());
    ASSERT(answered.value().transcript.text == "I led the migration.");
    ASSERT(answered.value().reason == EndOfTurn::Silence);

    auto timed_out = speech.transcribe(channel, turn.token(), Duration(30));
    ASSERT(timed_out.is_error());
    ASSERT(timed_out.error().type == ErrorType::SpeechTimeout);

    speech.cut_off();
    ASSERT(transcriber->was_cut_off());
    ASSERT(speech.transcription_timeout() == Duration(200));
    ASSERT(speech.synthesis_timeout() == Duration(200));
}

int main() {
    test_speak_streams_chunks();
    test_speak_failures();
    test_transcribe();

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All speech I/O tests passed.\n";
    return 0;
}
