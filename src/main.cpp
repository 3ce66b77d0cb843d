#include "audio_device_channel.h"
#include "clock.h"
#include "config.h"
#include "interview_session.h"
#include "logger.h"
#include "path_utils.h"
#include "plan_provider.h"
#include "session_recorder.h"
#include "session_registry.h"
#include "scoring/http_answer_scorer.h"
#include "scoring/keyword_scorer.h"
#include "speech/endpointed_transcriber.h"
#include "speech/piper_synthesizer.h"
#include "speech/speech_io_adapter.h"
#include "speech/whisper_recognizer.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h>

namespace viva {

static std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown = true;
}

struct CommandLine {
    std::string config_path;
    std::string plan_path;
    std::string candidate_id = "candidate";
    std::string job_id;
    bool list_devices = false;
};

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [config] [--plan FILE] [--candidate ID] [--job ID] [--list-devices]\n"
              << "Keys during the interview: p = pause, r = resume, q = abort, Enter = done answering\n";
}

static bool parse_command_line(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        if (arg == "--list-devices") {
            cmd.list_devices = true;
        } else if (arg == "--plan") {
            if (!next(cmd.plan_path)) return false;
        } else if (arg == "--candidate") {
            if (!next(cmd.candidate_id)) return false;
        } else if (arg == "--job") {
            if (!next(cmd.job_id)) return false;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] != '-' && cmd.config_path.empty()) {
            cmd.config_path = arg;
        } else {
            return false;
        }
    }
    return true;
}

// Config next to the executable (build/../config) when none is given
static std::string default_config_path() {
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir(buf);
        size_t pos = exe_dir.find_last_of('/');
        if (pos != std::string::npos) {
            std::string config_dir = exe_dir.substr(0, pos) + "/../config";
            std::ifstream test(config_dir + "/config.json");
            if (test.good()) {
                return config_dir;
            }
        }
    }
    return "config";
}

static AnswerScorerPtr create_scorer(const Config& config) {
    if (config.scorer.backend == "http") {
        return std::make_shared<HttpAnswerScorer>(config.scorer, config.timeouts.scoring_ms);
    }
    if (config.scorer.backend != "keyword") {
        LOG_WARN("Unknown scorer backend '" + config.scorer.backend + "', using keyword");
    }
    return std::make_shared<KeywordScorer>();
}

// Keyboard control: one key per line on stdin
static void keyboard_loop(AudioDeviceChannel& channel, const std::atomic<bool>& done) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;

    while (!done && !g_shutdown) {
        int ready = poll(&pfd, 1, 100);
        if (ready <= 0) continue;

        std::string line;
        if (!std::getline(std::cin, line)) {
            return;
        }
        if (line == "p") {
            channel.signal(ControlSignal::Pause);
        } else if (line == "r") {
            channel.signal(ControlSignal::Resume);
        } else if (line == "q") {
            channel.signal(ControlSignal::Abort);
        } else if (line.empty()) {
            channel.signal(ControlSignal::EndOfTurn);
        }
    }
}

} // namespace viva

int main(int argc, char* argv[]) {
    viva::Logger::initialize(viva::LogLevel::INFO);

    viva::CommandLine cmd;
    if (!viva::parse_command_line(argc, argv, cmd)) {
        viva::print_usage(argv[0]);
        viva::Logger::shutdown();
        return 2;
    }

    if (cmd.list_devices) {
        viva::AudioDeviceChannel::list_devices();
        viva::Logger::shutdown();
        return 0;
    }

    if (cmd.config_path.empty()) {
        cmd.config_path = viva::default_config_path();
    }
    viva::Config config = viva::Config::load_from_file(cmd.config_path);

    viva::Logger::shutdown();
    viva::Logger::initialize(viva::parse_log_level(config.logging.level), config.logging.file);

    auto valid = config.validate();
    if (valid.is_error()) {
        LOG_ERROR("Invalid config: " + valid.error().message);
        viva::Logger::shutdown();
        return 1;
    }

    std::unique_ptr<viva::IPlanProvider> provider;
    if (!cmd.plan_path.empty()) {
        provider = std::make_unique<viva::JsonFilePlanProvider>(viva::expand_path(cmd.plan_path),
                                                                config.plan_defaults);
    } else {
        provider = viva::create_plan_provider(config);
    }
    auto plan = provider->fetch(cmd.candidate_id, cmd.job_id);
    if (plan.is_error()) {
        LOG_ERROR("Could not load question plan: " + plan.error().to_string());
        viva::Logger::shutdown();
        return 1;
    }

    auto recognizer = std::make_shared<viva::WhisperRecognizer>(config.stt);
    if (!recognizer->is_ready()) {
        LOG_ERROR("Speech recognizer failed to load model: " + config.stt.model_path);
        viva::Logger::shutdown();
        return 1;
    }
    auto synthesizer = std::make_shared<viva::PiperSynthesizer>(config.tts, config.audio.sample_rate);
    if (!synthesizer->is_ready()) {
        LOG_WARN("Piper not found; questions will be delivered as text only");
    }
    auto transcriber = std::make_shared<viva::EndpointedTranscriber>(
        recognizer, config.vad, config.stt.blank_sentinel, config.audio.sample_rate);
    auto speech = std::make_shared<viva::SpeechIOAdapter>(synthesizer, transcriber, config.timeouts);

    auto channel = std::make_shared<viva::AudioDeviceChannel>(config.audio);
    if (!channel->start()) {
        LOG_ERROR("Failed to open audio devices");
        viva::Logger::shutdown();
        return 1;
    }

    viva::MonotonicClock clock;
    viva::TimerService timers(clock);
    timers.start();

    viva::SessionRecorder recorder(config.recorder);

    viva::SessionInfo info;
    info.id = viva::generate_session_id(cmd.candidate_id);
    info.candidate_id = cmd.candidate_id;
    info.job_id = cmd.job_id;
    info.interview_type = config.session.interview_type;

    viva::SessionDependencies deps;
    deps.clock = &clock;
    deps.timers = &timers;
    deps.speech = speech;
    deps.channel = channel;
    deps.scorer = viva::create_scorer(config);
    deps.sink = &recorder;

    auto session = std::make_shared<viva::InterviewSession>(info, config, deps);

    viva::SessionRegistry registry;
    auto added = registry.add(session);
    if (added.is_error()) {
        LOG_ERROR(added.error().to_string());
        timers.stop();
        channel->stop();
        viva::Logger::shutdown();
        return 1;
    }

    std::signal(SIGINT, viva::signal_handler);
    std::signal(SIGTERM, viva::signal_handler);

    auto started = session->start(std::move(plan.value()));
    if (started.is_error()) {
        LOG_ERROR("Session did not start: " + started.error().to_string());
        registry.remove(session->id());
        timers.stop();
        channel->stop();
        viva::Logger::shutdown();
        return 1;
    }

    viva::print_usage(argv[0]);

    std::atomic<bool> done{false};
    std::thread keyboard([&channel, &done]() { viva::keyboard_loop(*channel, done); });

    // Signal handlers only set a flag; the abort happens here
    while (!session->is_finished()) {
        if (viva::g_shutdown) {
            LOG_INFO("Shutting down...");
            registry.abort_all(viva::AbortReason::Shutdown, "signal");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    session->join();

    done = true;
    keyboard.join();

    viva::Phase final_phase = session->phase();
    LOG_SESSION("Session " + session->id() + " finished: " + viva::phase_name(final_phase));

    registry.remove_finished();
    recorder.flush();

    timers.stop();
    channel->stop();
    viva::Logger::shutdown();

    return final_phase == viva::Phase::Completed ? 0 : 1;
}
