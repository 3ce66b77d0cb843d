#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

/// Apply full JSON config (all sections) into cfg. Missing keys keep their defaults.
void apply_json_to_config(viva::Config& cfg, const json& j) {
    if (j.contains("session")) {
        auto& s = j["session"];
        if (s.contains("deadline_s")) cfg.session.deadline_s = s["deadline_s"];
        if (s.contains("interview_type")) cfg.session.interview_type = s["interview_type"].get<std::string>();
        if (s.contains("greeting")) cfg.session.greeting = s["greeting"].get<std::string>();
        if (s.contains("closing")) cfg.session.closing = s["closing"].get<std::string>();
        if (s.contains("no_answer_transition")) cfg.session.no_answer_transition = s["no_answer_transition"].get<std::string>();
    }

    if (j.contains("plan_defaults")) {
        auto& p = j["plan_defaults"];
        if (p.contains("min_s")) cfg.plan_defaults.min_s = p["min_s"];
        if (p.contains("target_s")) cfg.plan_defaults.target_s = p["target_s"];
        if (p.contains("max_s")) cfg.plan_defaults.max_s = p["max_s"];
        if (p.contains("weight")) cfg.plan_defaults.weight = p["weight"];
    }

    if (j.contains("decision")) {
        auto& d = j["decision"];
        if (d.contains("coverage_threshold")) cfg.decision.coverage_threshold = d["coverage_threshold"];
        if (d.contains("max_followup_depth")) cfg.decision.max_followup_depth = d["max_followup_depth"];
        if (d.contains("min_followup_cost_s")) cfg.decision.min_followup_cost_s = d["min_followup_cost_s"];
        if (d.contains("default_followup_prompt") && d["default_followup_prompt"].is_string())
            cfg.decision.default_followup_prompt = d["default_followup_prompt"].get<std::string>();
    }

    if (j.contains("timeouts")) {
        auto& t = j["timeouts"];
        if (t.contains("synthesis_ms")) cfg.timeouts.synthesis_ms = t["synthesis_ms"];
        if (t.contains("transcription_ms")) cfg.timeouts.transcription_ms = t["transcription_ms"];
        if (t.contains("scoring_ms")) cfg.timeouts.scoring_ms = t["scoring_ms"];
    }

    if (j.contains("vad")) {
        auto& v = j["vad"];
        if (v.contains("threshold")) cfg.vad.threshold = v["threshold"];
        if (v.contains("start_frames_required")) cfg.vad.start_frames_required = v["start_frames_required"];
        if (v.contains("end_of_turn_silence_ms"))
            cfg.vad.end_of_turn_silence_ms = v["end_of_turn_silence_ms"];
        if (v.contains("min_speech_ms")) cfg.vad.min_speech_ms = v["min_speech_ms"];
        if (v.contains("max_turn_ms")) cfg.vad.max_turn_ms = v["max_turn_ms"];
    }

    if (j.contains("stt")) {
        auto& s = j["stt"];
        if (s.contains("model_path")) cfg.stt.model_path = s["model_path"].get<std::string>();
        if (s.contains("language")) cfg.stt.language = s["language"].get<std::string>();
        if (s.contains("blank_sentinel")) cfg.stt.blank_sentinel = s["blank_sentinel"].get<std::string>();
        if (s.contains("use_gpu")) cfg.stt.use_gpu = s["use_gpu"];
        if (s.contains("n_threads")) cfg.stt.n_threads = s["n_threads"];
    }

    if (j.contains("tts")) {
        auto& t = j["tts"];
        if (t.contains("voice_path")) cfg.tts.voice_path = t["voice_path"].get<std::string>();
        if (t.contains("piper_path")) cfg.tts.piper_path = t["piper_path"].get<std::string>();
        if (t.contains("espeak_data_path")) cfg.tts.espeak_data_path = t["espeak_data_path"].get<std::string>();
        if (t.contains("output_gain")) cfg.tts.output_gain = t["output_gain"];
        if (t.contains("chunk_ms")) cfg.tts.chunk_ms = t["chunk_ms"];
    }

    if (j.contains("audio")) {
        auto& a = j["audio"];
        if (a.contains("input_device")) cfg.audio.input_device = a["input_device"].get<std::string>();
        if (a.contains("output_device")) cfg.audio.output_device = a["output_device"].get<std::string>();
        if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"];
    }

    if (j.contains("scorer")) {
        auto& s = j["scorer"];
        if (s.contains("backend")) cfg.scorer.backend = s["backend"].get<std::string>();
        if (s.contains("endpoint")) cfg.scorer.endpoint = s["endpoint"].get<std::string>();
        if (s.contains("model")) cfg.scorer.model = s["model"].get<std::string>();
        if (s.contains("api_key_env")) cfg.scorer.api_key_env = s["api_key_env"].get<std::string>();
        if (s.contains("temperature")) cfg.scorer.temperature = s["temperature"];
        if (s.contains("max_tokens")) cfg.scorer.max_tokens = s["max_tokens"];
        if (s.contains("system_prompt") && s["system_prompt"].is_string())
            cfg.scorer.system_prompt = s["system_prompt"].get<std::string>();
    }

    if (j.contains("plan_source")) {
        auto& p = j["plan_source"];
        if (p.contains("backend")) cfg.plan_source.backend = p["backend"].get<std::string>();
        if (p.contains("path")) cfg.plan_source.path = p["path"].get<std::string>();
        if (p.contains("endpoint")) cfg.plan_source.endpoint = p["endpoint"].get<std::string>();
        if (p.contains("timeout_ms")) cfg.plan_source.timeout_ms = p["timeout_ms"];
    }

    if (j.contains("recorder")) {
        auto& r = j["recorder"];
        if (r.contains("session_log_dir")) cfg.recorder.session_log_dir = r["session_log_dir"].get<std::string>();
        if (r.contains("persistence_url")) cfg.recorder.persistence_url = r["persistence_url"].get<std::string>();
        if (r.contains("post_timeout_ms")) cfg.recorder.post_timeout_ms = r["post_timeout_ms"];
    }

    if (j.contains("logging")) {
        auto& l = j["logging"];
        if (l.contains("level")) cfg.logging.level = l["level"].get<std::string>();
        if (l.contains("file")) cfg.logging.file = l["file"].get<std::string>();
    }
}

} // namespace

namespace viva {

VoidResult Config::validate() const {
    std::vector<std::string> problems;

    if (session.deadline_s <= 0) problems.push_back("session.deadline_s must be positive");
    if (plan_defaults.min_s < 0) problems.push_back("plan_defaults.min_s must not be negative");
    if (plan_defaults.min_s > plan_defaults.max_s) problems.push_back("plan_defaults.min_s exceeds plan_defaults.max_s");
    if (plan_defaults.target_s < plan_defaults.min_s || plan_defaults.target_s > plan_defaults.max_s)
        problems.push_back("plan_defaults.target_s must lie within [min_s, max_s]");
    if (plan_defaults.weight <= 0.0) problems.push_back("plan_defaults.weight must be positive");
    if (decision.coverage_threshold < 0.0f || decision.coverage_threshold > 1.0f)
        problems.push_back("decision.coverage_threshold must lie within [0, 1]");
    if (decision.max_followup_depth < 0) problems.push_back("decision.max_followup_depth must not be negative");
    if (decision.min_followup_cost_s < 0) problems.push_back("decision.min_followup_cost_s must not be negative");
    if (timeouts.synthesis_ms < 0 || timeouts.transcription_ms < 0 || timeouts.scoring_ms < 0)
        problems.push_back("timeouts must not be negative");
    if (vad.end_of_turn_silence_ms <= 0) problems.push_back("vad.end_of_turn_silence_ms must be positive");
    if (scorer.backend != "keyword" && scorer.backend != "http")
        problems.push_back("scorer.backend must be \"keyword\" or \"http\"");
    if (scorer.backend == "http" && scorer.endpoint.empty())
        problems.push_back("scorer.endpoint is required for the http backend");
    if (plan_source.backend != "file" && plan_source.backend != "http")
        problems.push_back("plan_source.backend must be \"file\" or \"http\"");
    if (plan_source.backend == "http" && plan_source.endpoint.empty())
        problems.push_back("plan_source.endpoint is required for the http backend");

    if (problems.empty()) {
        return VoidResult();
    }
    std::ostringstream oss;
    for (size_t i = 0; i < problems.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << problems[i];
    }
    return make_invalid_state_error(oss.str());
}

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::string file_path = path;
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        file_path = (fs::path(path) / "config.json").string();
    }
    cfg.config_dir_ = fs::path(file_path).parent_path().string();

    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + file_path + ". Using defaults.");
        return cfg;
    }
    json j;
    try {
        file >> j;
        apply_json_to_config(cfg, j);
    } catch (const json::exception& e) {
        Logger::error("Error parsing config JSON " + file_path + ": " + std::string(e.what()));
        return cfg;
    }

    if (!cfg.stt.model_path.empty()) cfg.stt.model_path = expand_path(cfg.stt.model_path);
    if (!cfg.tts.voice_path.empty()) cfg.tts.voice_path = expand_path(cfg.tts.voice_path);
    if (!cfg.tts.piper_path.empty()) cfg.tts.piper_path = expand_path(cfg.tts.piper_path);
    if (cfg.tts.espeak_data_path.empty())
        cfg.tts.espeak_data_path = default_espeak_data_path();
    else
        cfg.tts.espeak_data_path = expand_path(cfg.tts.espeak_data_path);
    if (cfg.plan_source.backend == "file")
        cfg.plan_source.path = resolve_relative(cfg.config_dir_, expand_path(cfg.plan_source.path));

    Logger::info("Loaded config: " + file_path);
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["session"]["deadline_s"] = session.deadline_s;
    j["session"]["interview_type"] = session.interview_type;
    j["session"]["greeting"] = session.greeting;
    j["session"]["closing"] = session.closing;
    j["session"]["no_answer_transition"] = session.no_answer_transition;

    j["plan_defaults"]["min_s"] = plan_defaults.min_s;
    j["plan_defaults"]["target_s"] = plan_defaults.target_s;
    j["plan_defaults"]["max_s"] = plan_defaults.max_s;
    j["plan_defaults"]["weight"] = plan_defaults.weight;

    j["decision"]["coverage_threshold"] = decision.coverage_threshold;
    j["decision"]["max_followup_depth"] = decision.max_followup_depth;
    j["decision"]["min_followup_cost_s"] = decision.min_followup_cost_s;
    j["decision"]["default_followup_prompt"] = decision.default_followup_prompt;

    j["timeouts"]["synthesis_ms"] = timeouts.synthesis_ms;
    j["timeouts"]["transcription_ms"] = timeouts.transcription_ms;
    j["timeouts"]["scoring_ms"] = timeouts.scoring_ms;

    j["vad"]["threshold"] = vad.threshold;
    j["vad"]["start_frames_required"] = vad.start_frames_required;
    j["vad"]["end_of_turn_silence_ms"] = vad.end_of_turn_silence_ms;
    j["vad"]["min_speech_ms"] = vad.min_speech_ms;
    j["vad"]["max_turn_ms"] = vad.max_turn_ms;

    j["stt"]["model_path"] = stt.model_path;
    j["stt"]["language"] = stt.language;
    j["stt"]["blank_sentinel"] = stt.blank_sentinel;
    j["stt"]["use_gpu"] = stt.use_gpu;
    j["stt"]["n_threads"] = stt.n_threads;

    j["tts"]["voice_path"] = tts.voice_path;
    j["tts"]["piper_path"] = tts.piper_path;
    j["tts"]["espeak_data_path"] = tts.espeak_data_path;
    j["tts"]["output_gain"] = tts.output_gain;
    j["tts"]["chunk_ms"] = tts.chunk_ms;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["sample_rate"] = audio.sample_rate;

    j["scorer"]["backend"] = scorer.backend;
    j["scorer"]["endpoint"] = scorer.endpoint;
    j["scorer"]["model"] = scorer.model;
    j["scorer"]["api_key_env"] = scorer.api_key_env;
    j["scorer"]["temperature"] = scorer.temperature;
    j["scorer"]["max_tokens"] = scorer.max_tokens;
    j["scorer"]["system_prompt"] = scorer.system_prompt;

    j["plan_source"]["backend"] = plan_source.backend;
    j["plan_source"]["path"] = plan_source.path;
    if (!plan_source.endpoint.empty()) j["plan_source"]["endpoint"] = plan_source.endpoint;
    j["plan_source"]["timeout_ms"] = plan_source.timeout_ms;

    j["recorder"]["session_log_dir"] = recorder.session_log_dir;
    if (!recorder.persistence_url.empty()) j["recorder"]["persistence_url"] = recorder.persistence_url;
    j["recorder"]["post_timeout_ms"] = recorder.post_timeout_ms;

    j["logging"]["level"] = logging.level;
    if (!logging.file.empty()) j["logging"]["file"] = logging.file;

    std::ofstream file(path);
    if (file.is_open()) {
        file << j.dump(2);
    } else {
        Logger::error("Could not write config file: " + path);
    }
}

} // namespace viva
