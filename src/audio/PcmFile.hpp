/**
 * @file PcmFile.hpp
 * @brief Reading and writing 16-bit PCM WAV files through FFmpeg.
 *
 * WavWriter appends interleaved s16 samples (or planar float, converted with
 * clamping) to a WAV container. readPcmFile() decodes a whole PCM WAV file
 * into planar float samples at its native rate and layout.
 *
 * @section Dependencies
 * - FFmpeg (libavformat wav muxer/demuxer, pcm codecs, libswresample)
 *
 * @section Patterns
 * - RAII: FFmpeg contexts are owned by unique_ptr holders.
 */

#pragma once
#include <filesystem>
#include <span>
#include <vector>
#include "audio/AudioFormat.hpp"
#include "audio/FFmpegUtils.hpp"
#include "util/Result.hpp"

namespace mc {

namespace fs = std::filesystem;

// Planar float audio: channels[c][frame], nominal range [-1, 1]
struct PcmData {
    AudioFormat format;
    std::vector<std::vector<f32>> channels;

    usize frames() const {
        return channels.empty() ? 0 : channels.front().size();
    }
    f64 seconds() const {
        return format.framesToSeconds(frames());
    }

    static PcmData silence(AudioFormat format, usize frames);
};

struct PcmFileInfo {
    AudioFormat format;
    u64 frames{0};
};

class WavWriter {
public:
    WavWriter();
    ~WavWriter();

    WavWriter(const WavWriter&) = delete;
    WavWriter& operator=(const WavWriter&) = delete;

    Result<void> open(const fs::path& path, const AudioFormat& format);
    Result<void> writeInterleaved(std::span<const i16> samples);
    Result<void> writePlanar(const PcmData& pcm);
    // Flushes the encoder and writes the trailer. Safe to call when not open.
    Result<void> close();

    bool isOpen() const {
        return formatCtx_ != nullptr;
    }
    u64 framesWritten() const {
        return framesWritten_;
    }
    const AudioFormat& format() const {
        return format_;
    }

private:
    Result<void> encode(AVFrame* frame);

    AVOutputContextPtr formatCtx_;
    AVCodecContextPtr codecCtx_;
    AVStream* stream_{nullptr};
    AVFramePtr frame_;
    AVPacketPtr packet_;
    AudioFormat format_;
    u64 framesWritten_{0};
    fs::path path_;
};

Result<PcmData> readPcmFile(const fs::path& path);
Result<PcmFileInfo> probePcmFile(const fs::path& path);

} // namespace mc
