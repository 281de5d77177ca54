/**
 * @file AudioFormat.hpp
 * @brief PCM stream format shared by capture, sinks and the mixer.
 *
 * Every stream in the pipeline is 16-bit signed little-endian PCM. Only the
 * sample rate and channel count vary between configurations.
 */

#pragma once
#include "util/Types.hpp"

namespace mc {

struct AudioFormat {
    static constexpr u32 kBitsPerSample = 16;

    u32 sampleRate{48000};
    u32 channels{2};

    u32 bytesPerFrame() const {
        return channels * (kBitsPerSample / 8);
    }

    f64 framesToSeconds(u64 frames) const {
        return sampleRate ? static_cast<f64>(frames) / sampleRate : 0.0;
    }

    u64 secondsToFrames(f64 seconds) const {
        return static_cast<u64>(seconds * sampleRate + 0.5);
    }

    bool valid() const {
        return sampleRate > 0 && channels > 0;
    }

    bool operator==(const AudioFormat&) const = default;
};

} // namespace mc
