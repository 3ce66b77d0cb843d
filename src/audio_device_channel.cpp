#include "audio_device_channel.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <iostream>
#include <mutex>
#include <sstream>

namespace viva {

class AudioDeviceChannel::Impl {
public:
    explicit Impl(const AudioConfig& config)
        : config_(config), input_stream_(nullptr), output_stream_(nullptr),
          running_(false), pa_initialized_(false) {}

    ~Impl() {
        stop();
    }

    bool start() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return false;
        }
        pa_initialized_ = true;

        int input_idx = find_device(config_.input_device, true);
        int output_idx = find_device(config_.output_device, false);
        if (input_idx < 0 || output_idx < 0) {
            Logger::error("Audio device not found (input='" + config_.input_device +
                          "', output='" + config_.output_device + "')");
            stop();
            return false;
        }

        const PaDeviceInfo* input_info = Pa_GetDeviceInfo(input_idx);
        const PaDeviceInfo* output_info = Pa_GetDeviceInfo(output_idx);
        if (!input_info || input_info->maxInputChannels == 0) {
            Logger::error("Input device has no input channels: " + config_.input_device);
            stop();
            return false;
        }

        std::ostringstream dev_oss;
        dev_oss << "Using input device: [" << input_idx << "] " << input_info->name
                << ", output device: [" << output_idx << "] " << (output_info ? output_info->name : "?");
        Logger::info(dev_oss.str());

        unsigned long frames_per_buffer = static_cast<unsigned long>(config_.sample_rate * FRAME_SIZE_MS / 1000);

        PaStreamParameters input_params;
        input_params.device = input_idx;
        input_params.channelCount = 1;
        input_params.sampleFormat = paInt16;
        input_params.suggestedLatency = input_info->defaultLowInputLatency;
        input_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&input_stream_, &input_params, nullptr, config_.sample_rate,
                            frames_per_buffer, paClipOff, input_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open input stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        PaStreamParameters output_params;
        output_params.device = output_idx;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = output_info ? output_info->defaultLowOutputLatency : 0.05;
        output_params.hostApiSpecificStreamInfo = nullptr;

        err = Pa_OpenStream(&output_stream_, nullptr, &output_params, config_.sample_rate,
                            frames_per_buffer, paClipOff, output_callback, this);
        if (err != paNoError) {
            Logger::error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        err = Pa_StartStream(input_stream_);
        if (err == paNoError) {
            err = Pa_StartStream(output_stream_);
        }
        if (err != paNoError) {
            Logger::error("Failed to start audio streams: " + std::string(Pa_GetErrorText(err)));
            stop();
            return false;
        }

        running_ = true;
        return true;
    }

    void stop() {
        running_ = false;
        input_cv_.notify_all();
        playback_cv_.notify_all();
        if (input_stream_) {
            Pa_StopStream(input_stream_);
            Pa_CloseStream(input_stream_);
            input_stream_ = nullptr;
        }
        if (output_stream_) {
            Pa_StopStream(output_stream_);
            Pa_CloseStream(output_stream_);
            output_stream_ = nullptr;
        }
        if (pa_initialized_) {
            Pa_Terminate();
            pa_initialized_ = false;
        }
    }

    bool read_audio(AudioChunk& chunk, Duration wait) {
        std::unique_lock<std::mutex> lock(input_mutex_);
        if (!input_cv_.wait_for(lock, wait, [this]() { return !input_queue_.empty() || !running_; })) {
            return false;
        }
        if (input_queue_.empty()) return false;
        chunk = std::move(input_queue_.front());
        input_queue_.pop_front();
        return true;
    }

    bool is_open() const { return running_; }

    void discard_pending() {
        std::lock_guard<std::mutex> lock(input_mutex_);
        input_queue_.clear();
    }

    void send_text(const std::string& text) {
        std::lock_guard<std::mutex> lock(console_mutex_);
        std::cout << "\n  Interviewer: " << text << "\n" << std::endl;
    }

    void send_audio(const AudioChunk& chunk, int sample_rate) {
        if (sample_rate != config_.sample_rate) {
            Logger::warn("Dropping audio at " + std::to_string(sample_rate) + "Hz (device runs at " +
                         std::to_string(config_.sample_rate) + "Hz)");
            return;
        }
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_queue_.insert(playback_queue_.end(), chunk.begin(), chunk.end());
    }

    void wait_output_drained(const CancellationToken& cancel) {
        ScopedCancelCallback wake(cancel, [this]() {
            std::lock_guard<std::mutex> lock(playback_mutex_);
            playback_cv_.notify_all();
        });
        std::unique_lock<std::mutex> lock(playback_mutex_);
        playback_cv_.wait(lock, [this, &cancel]() {
            return playback_queue_.empty() || cancel.is_cancelled() || !running_;
        });
    }

    void stop_output() {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_queue_.clear();
        playback_cv_.notify_all();
    }

    void set_control_handler(ControlHandler handler) {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler_ = std::move(handler);
    }

    void signal(ControlSignal control) {
        ControlHandler handler;
        {
            std::lock_guard<std::mutex> lock(handler_mutex_);
            handler = handler_;
        }
        LOG_AUDIO(std::string("Control signal: ") + control_signal_name(control));
        if (handler) handler(control);
    }

    static void list_devices() {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }

        int num_devices = Pa_GetDeviceCount();
        Logger::info("Available audio devices:");
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            std::ostringstream oss;
            oss << "  [" << i << "] " << info->name;
            if (info->maxInputChannels > 0) oss << " (IN:" << info->maxInputChannels << ")";
            if (info->maxOutputChannels > 0) oss << " (OUT:" << info->maxOutputChannels << ")";
            Logger::info(oss.str());
        }
        Pa_Terminate();
    }

private:
    static int input_callback(const void* input, void*, unsigned long frame_count,
                              const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user_data) {
        auto* self = static_cast<Impl*>(user_data);
        if (input) {
            const auto* samples = static_cast<const Sample*>(input);
            AudioChunk chunk(samples, samples + frame_count);
            std::lock_guard<std::mutex> lock(self->input_mutex_);
            self->input_queue_.push_back(std::move(chunk));
            // Keep at most ~10s of unread audio
            const size_t max_chunks = static_cast<size_t>(10000 / FRAME_SIZE_MS);
            while (self->input_queue_.size() > max_chunks) {
                self->input_queue_.pop_front();
            }
            self->input_cv_.notify_one();
        }
        return paContinue;
    }

    static int output_callback(const void*, void* output, unsigned long frame_count,
                               const PaStreamCallbackTimeInfo*, PaStreamCallbackFlags, void* user_data) {
        auto* self = static_cast<Impl*>(user_data);
        auto* out = static_cast<Sample*>(output);
        std::lock_guard<std::mutex> lock(self->playback_mutex_);
        size_t n = std::min(static_cast<size_t>(frame_count), self->playback_queue_.size());
        std::copy(self->playback_queue_.begin(), self->playback_queue_.begin() + static_cast<std::ptrdiff_t>(n), out);
        self->playback_queue_.erase(self->playback_queue_.begin(),
                                    self->playback_queue_.begin() + static_cast<std::ptrdiff_t>(n));
        if (n < frame_count) {
            std::memset(out + n, 0, (frame_count - n) * sizeof(Sample));
        }
        if (self->playback_queue_.empty()) {
            self->playback_cv_.notify_all();
        }
        return paContinue;
    }

    int find_device(const std::string& name, bool is_input) {
        if (name == "default" || name.empty()) {
            int idx = is_input ? Pa_GetDefaultInputDevice() : Pa_GetDefaultOutputDevice();
            return idx == paNoDevice ? -1 : idx;
        }

        bool numeric = std::all_of(name.begin(), name.end(),
                                   [](unsigned char c) { return std::isdigit(c); });
        int num_devices = Pa_GetDeviceCount();
        if (numeric) {
            int idx = std::stoi(name);
            return (idx >= 0 && idx < num_devices) ? idx : -1;
        }

        std::string wanted = name;
        std::transform(wanted.begin(), wanted.end(), wanted.begin(), ::tolower);
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (!info) continue;
            if ((is_input && info->maxInputChannels == 0) || (!is_input && info->maxOutputChannels == 0)) continue;
            std::string candidate = info->name;
            std::transform(candidate.begin(), candidate.end(), candidate.begin(), ::tolower);
            if (candidate.find(wanted) != std::string::npos) {
                return i;
            }
        }
        return -1;
    }

    AudioConfig config_;
    PaStream* input_stream_;
    PaStream* output_stream_;
    std::atomic<bool> running_;
    bool pa_initialized_;

    std::mutex input_mutex_;
    std::condition_variable input_cv_;
    std::deque<AudioChunk> input_queue_;

    std::mutex playback_mutex_;
    std::condition_variable playback_cv_;
    std::deque<Sample> playback_queue_;

    std::mutex handler_mutex_;
    ControlHandler handler_;

    std::mutex console_mutex_;
};

AudioDeviceChannel::AudioDeviceChannel(const AudioConfig& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

AudioDeviceChannel::~AudioDeviceChannel() = default;

bool AudioDeviceChannel::start() { return pimpl_->start(); }
void AudioDeviceChannel::stop() { pimpl_->stop(); }

bool AudioDeviceChannel::read_audio(AudioChunk& chunk, Duration wait) { return pimpl_->read_audio(chunk, wait); }
bool AudioDeviceChannel::is_open() const { return pimpl_->is_open(); }
void AudioDeviceChannel::discard_pending() { pimpl_->discard_pending(); }

void AudioDeviceChannel::send_text(const std::string& text) { pimpl_->send_text(text); }
void AudioDeviceChannel::send_audio(const AudioChunk& chunk, int sample_rate) { pimpl_->send_audio(chunk, sample_rate); }
void AudioDeviceChannel::wait_output_drained(const CancellationToken& cancel) { pimpl_->wait_output_drained(cancel); }
void AudioDeviceChannel::stop_output() { pimpl_->stop_output(); }
void AudioDeviceChannel::set_control_handler(ControlHandler handler) { pimpl_->set_control_handler(std::move(handler)); }

void AudioDeviceChannel::signal(ControlSignal control) { pimpl_->signal(control); }

void AudioDeviceChannel::list_devices() { Impl::list_devices(); }

} // namespace viva
