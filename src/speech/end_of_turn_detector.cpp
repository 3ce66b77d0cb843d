#include "speech/end_of_turn_detector.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace viva {

class EndOfTurnDetector::Impl {
public:
    Impl(const VADConfig& config, int sample_rate)
        : config_(config),
          sample_rate_(sample_rate > 0 ? sample_rate : DEFAULT_SAMPLE_RATE),
          state_(State::Waiting),
          noise_floor_(config.threshold * 0.3f),
          noise_floor_initialized_(false) {
        min_speech_samples_ = (static_cast<int64_t>(config_.min_speech_ms) * sample_rate_) / 1000;
        end_silence_samples_ = (static_cast<int64_t>(config_.end_of_turn_silence_ms) * sample_rate_) / 1000;
        max_turn_samples_ = (static_cast<int64_t>(config_.max_turn_ms) * sample_rate_) / 1000;
        start_frames_required_ = std::max(1, config_.start_frames_required);
    }

    TurnEvent process(const AudioChunk& frame) {
        float rms = compute_energy(frame);
        update_noise_floor(rms);
        float effective_start = std::max(config_.threshold, noise_floor_ * 2.0f + 0.02f);
        // Only clear speech resets the silence counter; breathing and small bumps do not
        float clear_threshold = std::max(config_.threshold * 0.5f, noise_floor_ * 2.0f + 0.03f);

        switch (state_) {
            case State::Waiting:
                if (rms > effective_start) {
                    consecutive_speech_frames_++;
                    if (consecutive_speech_frames_ >= start_frames_required_) {
                        state_ = State::Speech;
                        speech_samples_ = static_cast<int64_t>(frame.size());
                        silence_samples_ = 0;
                        consecutive_speech_frames_ = 0;
                        segment_.assign(frame.begin(), frame.end());
                        std::ostringstream oss;
                        oss << "SpeechStart rms=" << rms << " threshold=" << effective_start;
                        LOG_VAD(oss.str());
                        return TurnEvent::SpeechStart;
                    }
                } else {
                    consecutive_speech_frames_ = 0;
                }
                return TurnEvent::None;

            case State::Speech:
                segment_.insert(segment_.end(), frame.begin(), frame.end());
                if (rms > clear_threshold) {
                    speech_samples_ += static_cast<int64_t>(frame.size());
                    silence_samples_ = 0;
                } else {
                    silence_samples_ += static_cast<int64_t>(frame.size());
                }

                if (max_turn_samples_ > 0 && static_cast<int64_t>(segment_.size()) >= max_turn_samples_) {
                    LOG_VAD("Turn reached max duration");
                    state_ = State::Waiting;
                    return TurnEvent::EndOfTurn;
                }

                if (silence_samples_ >= end_silence_samples_) {
                    if (speech_samples_ < min_speech_samples_) {
                        LOG_VAD("Dropped " + std::to_string(speech_samples_ * 1000 / sample_rate_) +
                                "ms burst as noise");
                        reset_segment();
                        return TurnEvent::None;
                    }
                    std::ostringstream oss;
                    oss << "EndOfTurn silence_ms=" << (silence_samples_ * 1000 / sample_rate_)
                        << " speech_ms=" << (speech_samples_ * 1000 / sample_rate_);
                    LOG_VAD(oss.str());
                    state_ = State::Waiting;
                    return TurnEvent::EndOfTurn;
                }
                return TurnEvent::None;
        }
        return TurnEvent::None;
    }

    bool in_speech() const { return state_ == State::Speech; }

    const AudioBuffer& segment() const { return segment_; }

    AudioBuffer take_segment() {
        AudioBuffer result;
        result.swap(segment_);
        return result;
    }

    int64_t segment_ms() const {
        return static_cast<int64_t>(segment_.size()) * 1000 / sample_rate_;
    }

    void reset() {
        reset_segment();
        noise_floor_initialized_ = false;
        noise_floor_ = config_.threshold * 0.3f;
    }

private:
    enum class State {
        Waiting,
        Speech
    };

    void reset_segment() {
        state_ = State::Waiting;
        speech_samples_ = 0;
        silence_samples_ = 0;
        consecutive_speech_frames_ = 0;
        segment_.clear();
    }

    void update_noise_floor(float rms) {
        const float alpha_silence = 0.92f;
        const float alpha_speech = 0.995f;
        const float min_noise = 0.005f;
        const float max_noise = 0.25f;
        if (state_ == State::Waiting) {
            if (!noise_floor_initialized_) {
                noise_floor_ = std::max(min_noise, std::min(max_noise, rms));
                noise_floor_initialized_ = true;
            } else {
                noise_floor_ = alpha_silence * noise_floor_ + (1.0f - alpha_silence) * rms;
                noise_floor_ = std::max(min_noise, std::min(max_noise, noise_floor_));
            }
        } else if (rms <= noise_floor_ * 1.5f + 0.02f) {
            noise_floor_ = alpha_speech * noise_floor_ + (1.0f - alpha_speech) * std::max(rms, min_noise);
            noise_floor_ = std::max(min_noise, std::min(max_noise, noise_floor_));
        }
    }

    float compute_energy(const AudioChunk& frame) const {
        if (frame.empty()) return 0.0f;
        float sum_sq = 0.0f;
        for (Sample s : frame) {
            float normalized = static_cast<float>(s) / 32768.0f;
            sum_sq += normalized * normalized;
        }
        return std::sqrt(sum_sq / static_cast<float>(frame.size()));
    }

    VADConfig config_;
    int sample_rate_;
    State state_;
    int start_frames_required_;
    int consecutive_speech_frames_ = 0;
    int64_t speech_samples_ = 0;
    int64_t silence_samples_ = 0;
    int64_t min_speech_samples_;
    int64_t end_silence_samples_;
    int64_t max_turn_samples_;
    AudioBuffer segment_;
    float noise_floor_;
    bool noise_floor_initialized_;
};

EndOfTurnDetector::EndOfTurnDetector(const VADConfig& config, int sample_rate)
    : pimpl_(std::make_unique<Impl>(config, sample_rate)) {}

EndOfTurnDetector::~EndOfTurnDetector() = default;

TurnEvent EndOfTurnDetector::process(const AudioChunk& frame) {
    return pimpl_->process(frame);
}

bool EndOfTurnDetector::in_speech() const {
    return pimpl_->in_speech();
}

const AudioBuffer& EndOfTurnDetector::segment() const {
    return pimpl_->segment();
}

AudioBuffer EndOfTurnDetector::take_segment() {
    return pimpl_->take_segment();
}

int64_t EndOfTurnDetector::segment_ms() const {
    return pimpl_->segment_ms();
}

void EndOfTurnDetector::reset() {
    pimpl_->reset();
}

} // namespace viva
