#pragma once

#include "candidate_channel.h"
#include "config.h"
#include <memory>
#include <string>

namespace viva {

/**
 * @brief Candidate channel on the local sound card (PortAudio)
 *
 * Microphone frames are queued by the input callback; speaker audio is
 * queued and played by the output callback. Text is printed to stdout.
 * Control signals are injected with signal() (main wires the keyboard).
 *
 * Thread Safety: all public methods may be called from any thread.
 */
class AudioDeviceChannel : public ICandidateChannel {
public:
    explicit AudioDeviceChannel(const AudioConfig& config);
    ~AudioDeviceChannel() override;

    AudioDeviceChannel(const AudioDeviceChannel&) = delete;
    AudioDeviceChannel& operator=(const AudioDeviceChannel&) = delete;

    /// Open and start the streams. @return false on device errors
    bool start();
    void stop();

    bool read_audio(AudioChunk& chunk, Duration wait) override;
    bool is_open() const override;
    void discard_pending() override;

    void send_text(const std::string& text) override;
    void send_audio(const AudioChunk& chunk, int sample_rate) override;
    void wait_output_drained(const CancellationToken& cancel) override;
    void stop_output() override;
    void set_control_handler(ControlHandler handler) override;

    /// Deliver a control signal as if it came from the candidate.
    void signal(ControlSignal control);

    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace viva
