#include "speech/whisper_recognizer.h"
#include "logger.h"
#include <whisper.h>
#include <chrono>
#include <mutex>
#include <sstream>

namespace viva {

class WhisperRecognizer::Impl {
public:
    Impl(const STTConfig& config) : config_(config), ctx_(nullptr) {
        if (config_.model_path.empty()) {
            LOG_STT("No model path specified");
            return;
        }

        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            LOG_ERROR("[STT] Failed to load whisper model: " + config_.model_path);
            return;
        }
        LOG_STT("Model loaded: " + config_.model_path);
    }

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    Result<Transcript> recognize(const AudioBuffer& audio) {
        if (!ctx_) {
            return make_io_error("whisper model not loaded");
        }
        Transcript result;
        if (audio.empty()) {
            return result;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto start = std::chrono::steady_clock::now();

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.translate = false;
        params.language = config_.language.c_str();
        params.n_threads = config_.n_threads;
        params.no_context = true;
        params.single_segment = false;

        std::vector<float> pcmf32(audio.size());
        for (size_t i = 0; i < audio.size(); i++) {
            pcmf32[i] = static_cast<float>(audio[i]) / 32768.0f;
        }

        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            std::ostringstream oss;
            oss << "whisper_full failed: " << ret;
            return make_io_error(oss.str());
        }

        int n_segments = whisper_full_n_segments(ctx_);
        int total_tokens = 0;
        float total_prob = 0.0f;
        std::string text;
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
            int n_tokens = whisper_full_n_tokens(ctx_, i);
            total_tokens += n_tokens;
            for (int j = 0; j < n_tokens; j++) {
                total_prob += whisper_full_get_token_p(ctx_, i, j);
            }
        }

        result.text = text;
        result.confidence = total_tokens > 0 ? (total_prob / total_tokens) : 0.0f;
        result.token_count = total_tokens;
        result.processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        return result;
    }

    bool is_ready() const {
        return ctx_ != nullptr;
    }

private:
    STTConfig config_;
    whisper_context* ctx_;
    std::mutex mutex_;
};

WhisperRecognizer::WhisperRecognizer(const STTConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

WhisperRecognizer::~WhisperRecognizer() = default;

Result<Transcript> WhisperRecognizer::recognize(const AudioBuffer& audio) {
    return pimpl_->recognize(audio);
}

bool WhisperRecognizer::is_ready() const {
    return pimpl_->is_ready();
}

} // namespace viva
