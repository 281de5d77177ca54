/**
 * @file SampleBuffer.hpp
 * @brief Immutable chunk of interleaved PCM audio.
 *
 * A SampleBuffer is the unit moved through the capture pipeline. It is
 * move-only: ownership passes from the capture source to exactly one sink
 * (a pre-buffer ring or a file sink) and is never shared.
 */

#pragma once
#include <span>
#include <vector>
#include "audio/AudioFormat.hpp"
#include "util/Types.hpp"

namespace mc {

class SampleBuffer {
public:
    // `samples` is interleaved; a trailing partial frame is discarded.
    SampleBuffer(AudioFormat format, std::vector<i16> samples, Seconds pts);

    SampleBuffer(SampleBuffer&&) noexcept = default;
    SampleBuffer& operator=(SampleBuffer&&) noexcept = default;
    SampleBuffer(const SampleBuffer&) = delete;
    SampleBuffer& operator=(const SampleBuffer&) = delete;

    const AudioFormat& format() const {
        return format_;
    }
    usize frameCount() const {
        return frameCount_;
    }
    // frameCount / sampleRate
    Seconds duration() const {
        return Seconds(format_.framesToSeconds(frameCount_));
    }
    Seconds presentationTime() const {
        return pts_;
    }
    std::span<const i16> samples() const {
        return samples_;
    }
    bool empty() const {
        return frameCount_ == 0;
    }

private:
    AudioFormat format_;
    std::vector<i16> samples_;
    usize frameCount_{0};
    Seconds pts_{0.0};
};

} // namespace mc
