/**
 * @file PulseAudioSource.hpp
 * @brief PulseAudio/PipeWire capture of system audio or the microphone.
 *
 * The system source records from the monitor of the default sink; the
 * microphone source records from the default input. Works with both
 * PulseAudio and PipeWire (via pipewire-pulse).
 *
 * @section Dependencies
 * - libpulse-simple
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "capture/CaptureSource.hpp"
#include "core/ConfigData.hpp"

namespace mc {

class PulseAudioSource : public CaptureSource {
public:
    PulseAudioSource(SourceKind kind,
                     std::string device,
                     AudioFormat format,
                     u32 chunkFrames,
                     std::chrono::milliseconds stopTimeout);
    ~PulseAudioSource() override;

    Result<void> start(BufferCallback onBuffer,
                       FailureCallback onFailure) override;

    // Waits at most `stopTimeout` for the capture thread. A thread still
    // blocked in the server after that is detached and releases its stream
    // on its own; it delivers nothing further.
    void stop() override;

    bool isRunning() const override;
    SourceKind kind() const override {
        return kind_;
    }
    std::string name() const override;

private:
    struct Stream;

    static void captureLoop(std::stop_token stopToken,
                            std::shared_ptr<Stream> stream);

    SourceKind kind_;
    std::string device_;
    AudioFormat format_;
    u32 chunkFrames_;
    std::chrono::milliseconds stopTimeout_;

    std::shared_ptr<Stream> stream_;
    std::jthread thread_;
};

// Builds PulseAudio sources for the devices named in the audio config
CaptureSourceFactory pulseAudioSourceFactory(const AudioConfig& audio,
                                             std::chrono::milliseconds stopTimeout);

} // namespace mc
