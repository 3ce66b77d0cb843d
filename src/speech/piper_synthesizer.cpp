#include "speech/piper_synthesizer.h"
#include "logger.h"
#include "path_utils.h"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace viva {

namespace {

constexpr int PIPER_SAMPLE_RATE = 22050;

std::string escape_json(const std::string& text) {
    std::string result;
    result.reserve(text.size() * 2);
    for (char c : text) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result += c; break;
        }
    }
    return result;
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty()) return input;

    float ratio = static_cast<float>(from_rate) / static_cast<float>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);
    for (size_t i = 0; i < output_samples; i++) {
        float input_pos = static_cast<float>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);
        float t = input_pos - static_cast<float>(idx0);
        float interpolated = static_cast<float>(input[idx0]) * (1.0f - t) + static_cast<float>(input[idx1]) * t;
        output.push_back(static_cast<Sample>(interpolated));
    }
    return output;
}

/**
 * One piper process per stream: JSON text on stdin, raw 22.05kHz PCM on stdout.
 */
class PiperStream : public IAudioStream {
public:
    PiperStream(std::string text, std::string piper_path, TTSConfig config,
                std::string espeak_data, int sample_rate)
        : text_(std::move(text)), piper_path_(std::move(piper_path)), config_(std::move(config)),
          espeak_data_(std::move(espeak_data)), sample_rate_(sample_rate) {
        chunk_samples_ = static_cast<size_t>(std::max(20, config_.chunk_ms)) * static_cast<size_t>(sample_rate_) / 1000;
    }

    ~PiperStream() override {
        stop();
    }

    bool next(AudioChunk& chunk, const CancellationToken& cancel) override {
        if (finished_) return false;
        if (!started_) {
            started_ = true;
            if (!start()) {
                finished_ = true;
                return false;
            }
        }

        std::vector<char> buffer(8192);
        while (ready_.size() < chunk_samples_ && !eof_) {
            if (cancel.is_cancelled()) {
                error_ = make_cancelled_error("synthesis cancelled");
                stop();
                finished_ = true;
                return false;
            }
            ssize_t n = read(out_fd_, buffer.data(), buffer.size());
            if (n > 0) {
                append_bytes(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0) {
                eof_ = true;
            } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
                usleep(10000);
            } else {
                error_ = make_io_error("read from piper failed");
                eof_ = true;
            }
        }

        if (eof_ && !raw_.empty()) {
            flush_raw();
        }

        if (ready_.empty()) {
            finished_ = true;
            reap();
            if (!error_.is_error() && samples_out_ == 0) {
                error_ = make_io_error("piper produced no audio");
            }
            return false;
        }

        size_t take = std::min(chunk_samples_, ready_.size());
        chunk.assign(ready_.begin(), ready_.begin() + static_cast<std::ptrdiff_t>(take));
        ready_.erase(ready_.begin(), ready_.begin() + static_cast<std::ptrdiff_t>(take));
        for (auto& sample : chunk) {
            sample = static_cast<Sample>(std::clamp(static_cast<float>(sample) * config_.output_gain,
                                                    -32768.0f, 32767.0f));
        }
        samples_out_ += take;
        return true;
    }

    int sample_rate() const override { return sample_rate_; }

    Error error() const override { return error_; }

private:
    bool start() {
        if (piper_path_.empty()) {
            error_ = make_io_error("piper executable not found");
            return false;
        }

        int in_pipe[2];
        int out_pipe[2];
        if (pipe(in_pipe) == -1) {
            error_ = make_io_error("failed to create pipe for piper");
            return false;
        }
        if (pipe(out_pipe) == -1) {
            close(in_pipe[0]);
            close(in_pipe[1]);
            error_ = make_io_error("failed to create pipe for piper");
            return false;
        }

        pid_ = fork();
        if (pid_ == -1) {
            close(in_pipe[0]);
            close(in_pipe[1]);
            close(out_pipe[0]);
            close(out_pipe[1]);
            error_ = make_io_error("failed to fork piper");
            return false;
        }

        if (pid_ == 0) {
            dup2(in_pipe[0], STDIN_FILENO);
            dup2(out_pipe[1], STDOUT_FILENO);
            close(in_pipe[0]);
            close(in_pipe[1]);
            close(out_pipe[0]);
            close(out_pipe[1]);
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDERR_FILENO);
                close(devnull);
            }
            execl(piper_path_.c_str(), "piper",
                  "--model", config_.voice_path.c_str(),
                  "--espeak_data", espeak_data_.c_str(),
                  "--json-input",
                  "--output_raw",
                  "--quiet",
                  nullptr);
            _exit(127);
        }

        close(in_pipe[0]);
        close(out_pipe[1]);
        out_fd_ = out_pipe[0];
        int flags = fcntl(out_fd_, F_GETFL, 0);
        fcntl(out_fd_, F_SETFL, flags | O_NONBLOCK);

        std::string json_input = "{\"text\": \"" + escape_json(text_) + "\"}\n";
        ssize_t written = write(in_pipe[1], json_input.c_str(), json_input.size());
        close(in_pipe[1]);
        if (written != static_cast<ssize_t>(json_input.size())) {
            error_ = make_io_error("failed to write text to piper");
            stop();
            return false;
        }
        LOG_TTS("piper started (PID " + std::to_string(pid_) + ") for " +
                std::to_string(text_.size()) + " chars");
        return true;
    }

    void append_bytes(const char* data, size_t size) {
        size_t i = 0;
        if (leftover_byte_valid_ && size > 0) {
            raw_.push_back(static_cast<Sample>(static_cast<uint8_t>(leftover_byte_) |
                                               (static_cast<int8_t>(data[0]) << 8)));
            leftover_byte_valid_ = false;
            i = 1;
        }
        for (; i + 1 < size; i += 2) {
            raw_.push_back(static_cast<Sample>(static_cast<uint8_t>(data[i]) |
                                               (static_cast<int8_t>(data[i + 1]) << 8)));
        }
        if (i < size) {
            leftover_byte_ = data[i];
            leftover_byte_valid_ = true;
        }
        // Resample in blocks that map to whole output samples
        const size_t block = PIPER_SAMPLE_RATE / 10;
        if (raw_.size() >= block) {
            size_t whole = (raw_.size() / block) * block;
            AudioBuffer head(raw_.begin(), raw_.begin() + static_cast<std::ptrdiff_t>(whole));
            raw_.erase(raw_.begin(), raw_.begin() + static_cast<std::ptrdiff_t>(whole));
            AudioBuffer converted = resample(head, PIPER_SAMPLE_RATE, sample_rate_);
            ready_.insert(ready_.end(), converted.begin(), converted.end());
        }
    }

    void flush_raw() {
        AudioBuffer converted = resample(raw_, PIPER_SAMPLE_RATE, sample_rate_);
        ready_.insert(ready_.end(), converted.begin(), converted.end());
        raw_.clear();
    }

    void reap() {
        if (out_fd_ >= 0) {
            close(out_fd_);
            out_fd_ = -1;
        }
        if (pid_ > 0) {
            int status = 0;
            waitpid(pid_, &status, 0);
            if (WIFEXITED(status) && WEXITSTATUS(status) != 0 && !error_.is_error()) {
                error_ = make_io_error("piper exited with status " + std::to_string(WEXITSTATUS(status)));
            }
            pid_ = -1;
        }
    }

    void stop() {
        if (pid_ > 0) {
            kill(pid_, SIGTERM);
        }
        reap();
    }

    std::string text_;
    std::string piper_path_;
    TTSConfig config_;
    std::string espeak_data_;
    int sample_rate_;
    size_t chunk_samples_ = 0;

    pid_t pid_ = -1;
    int out_fd_ = -1;
    bool started_ = false;
    bool finished_ = false;
    bool eof_ = false;
    char leftover_byte_ = 0;
    bool leftover_byte_valid_ = false;
    size_t samples_out_ = 0;
    AudioBuffer raw_;
    AudioBuffer ready_;
    Error error_;
};

} // namespace

PiperSynthesizer::PiperSynthesizer(const TTSConfig& config, int sample_rate)
    : config_(config), sample_rate_(sample_rate) {
    espeak_data_ = config_.espeak_data_path.empty() ? default_espeak_data_path() : config_.espeak_data_path;
    find_piper_path();
}

AudioStreamPtr PiperSynthesizer::synthesize(const std::string& text) {
    return std::make_unique<PiperStream>(text, piper_path_, config_, espeak_data_, sample_rate_);
}

void PiperSynthesizer::find_piper_path() {
    if (!config_.piper_path.empty()) {
        std::ifstream test(config_.piper_path);
        if (test.good()) {
            piper_path_ = config_.piper_path;
            LOG_TTS("Using config piper path: " + piper_path_);
            return;
        }
    }

    std::vector<std::string> possible_paths;
    const char* home = std::getenv("HOME");
    if (home) {
        possible_paths.push_back(std::string(home) + "/bin/piper");
        possible_paths.push_back(std::string(home) + "/.local/bin/piper");
    }
    possible_paths.push_back("/usr/local/bin/piper");
    possible_paths.push_back("/usr/bin/piper");
#ifdef __APPLE__
    possible_paths.push_back("/opt/homebrew/bin/piper");
#endif

    for (const auto& path : possible_paths) {
        std::ifstream test(path);
        if (test.good()) {
            piper_path_ = path;
            LOG_TTS("Found piper at: " + piper_path_);
            return;
        }
    }

    FILE* fp = popen("which piper 2>/dev/null", "r");
    if (fp) {
        char buffer[256];
        if (fgets(buffer, sizeof(buffer), fp)) {
            piper_path_ = buffer;
            while (!piper_path_.empty() && (piper_path_.back() == '\n' || piper_path_.back() == '\r')) {
                piper_path_.pop_back();
            }
            LOG_TTS("Found piper in PATH: " + piper_path_);
        }
        pclose(fp);
    }

    if (piper_path_.empty()) {
        LOG_WARN("[TTS] Piper not found; questions will be sent as text only");
    }
}

} // namespace viva
