#pragma once

#include "common.h"
#include "errors.h"
#include <string>
#include <cstdint>
#include <vector>

namespace viva {

struct SessionConfig {
    int deadline_s = 1800;                    ///< Global interview duration
    std::string interview_type = "standard";
    std::string greeting = "Hello, and thank you for joining. Let's begin the interview.";
    std::string closing = "That concludes our interview. Thank you for your time.";
    /// Spoken when the candidate gives no answer before the next question
    std::string no_answer_transition = "Let's move on to the next question.";
};

/// Defaults applied to plan items that omit their own timing or weight
struct PlanDefaultsConfig {
    int min_s = 180;
    int target_s = 480;
    int max_s = 720;
    double weight = 1.0;
};

struct DecisionConfig {
    float coverage_threshold = 0.6f;     ///< Coverage below this asks for a follow-up
    int max_followup_depth = 1;          ///< Follow-ups allowed per item
    int min_followup_cost_s = 60;        ///< Item budget needed for one more round
    std::string default_followup_prompt = "Could you expand on that with a concrete example?";

    Duration min_followup_cost() const { return Duration(static_cast<int64_t>(min_followup_cost_s) * 1000); }
};

/// Per-call timeouts for the suspend points (0 = no timeout)
struct TimeoutsConfig {
    int synthesis_ms = 10000;
    int transcription_ms = 180000;
    int scoring_ms = 5000;
};

struct VADConfig {
    float threshold = 0.02f;                 ///< Normalized RMS above which a frame is speech
    int start_frames_required = 2;           ///< Consecutive speech frames to trigger SpeechStart
    int end_of_turn_silence_ms = 1500;       ///< Trailing silence that ends the candidate's turn
    int min_speech_ms = 300;                 ///< Shorter bursts are discarded as noise
    int max_turn_ms = 0;                     ///< Hard cap on one answer's audio (0 = none)
};

struct STTConfig {
    std::string model_path;
    std::string language = "en";
    std::string blank_sentinel = "[BLANK_AUDIO]";  ///< Treat this exact string (after trim) as blank
    bool use_gpu = true;
    int n_threads = 4;
};

struct TTSConfig {
    std::string voice_path;
    std::string piper_path;         ///< Piper binary path (empty = auto-detect)
    std::string espeak_data_path;   ///< espeak-ng data dir (empty = platform default)
    float output_gain = 1.0f;
    int chunk_ms = 200;             ///< Size of streamed audio chunks
};

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int sample_rate = DEFAULT_SAMPLE_RATE;
};

/// Reasoning subsystem used for answer coverage scoring
struct ScorerConfig {
    std::string backend = "keyword";   ///< "keyword" | "http"
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-4o-mini";
    std::string api_key_env = "OPENAI_API_KEY";
    float temperature = 0.0f;
    int max_tokens = 150;
    std::string system_prompt =
        "You evaluate interview answers. Reply with JSON only: "
        "{\"coverage\": <0..1, how completely the answer covers the expected points>, "
        "\"follow_up\": \"<one short probing question, or empty>\"}.";
};

/// Where the initial question plan comes from (JD/CV matching subsystem)
struct PlanSourceConfig {
    std::string backend = "file";   ///< "file" | "http"
    std::string path = "plan.json";
    std::string endpoint;
    int timeout_ms = 5000;
};

struct RecorderConfig {
    std::string session_log_dir = "sessions";
    std::string persistence_url;    ///< Optional: POST exchanges and summaries here
    int post_timeout_ms = 500;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
};

struct Config {
    SessionConfig session;
    PlanDefaultsConfig plan_defaults;
    DecisionConfig decision;
    TimeoutsConfig timeouts;
    VADConfig vad;
    STTConfig stt;
    TTSConfig tts;
    AudioConfig audio;
    ScorerConfig scorer;
    PlanSourceConfig plan_source;
    RecorderConfig recorder;
    LoggingConfig logging;

    /// Directory of the loaded config file; relative plan paths resolve against it
    std::string config_dir_;

    Duration deadline() const { return Duration(static_cast<int64_t>(session.deadline_s) * 1000); }
    Duration min_followup_cost() const { return decision.min_followup_cost(); }

    /// Check ranges and cross-field constraints. InvalidState error lists every problem found.
    VoidResult validate() const;

    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

} // namespace viva
