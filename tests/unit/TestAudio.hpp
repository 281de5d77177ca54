/**
 * @file TestAudio.hpp
 * @brief WAV fixtures shared by the audio, recorder and library tests.
 */

#pragma once
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>
#include "audio/PcmFile.hpp"

namespace mc::test {

// 8 kHz mono keeps the recorder tests small
inline constexpr AudioFormat kTestFormat{8000, 1};

// Writes `frames` frames of a constant sample value. Zero frames produces a
// header-only file.
inline bool writeConstantWav(const std::filesystem::path& path,
                             const AudioFormat& format,
                             usize frames,
                             i16 value) {
    WavWriter writer;
    if (!writer.open(path, format))
        return false;
    std::vector<i16> samples(frames * format.channels, value);
    if (!samples.empty() && !writer.writeInterleaved(samples))
        return false;
    return static_cast<bool>(writer.close());
}

// Raw s16le samples from the "data" chunk, read without FFmpeg. Empty if
// the file is not a RIFF/WAVE file.
inline std::vector<i16> readS16(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<char> bytes((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
    std::vector<i16> samples;
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0)
        return samples;

    auto le32 = [&](usize at) {
        const auto* p = reinterpret_cast<const unsigned char*>(bytes.data() + at);
        return static_cast<u32>(p[0]) | (static_cast<u32>(p[1]) << 8) |
               (static_cast<u32>(p[2]) << 16) | (static_cast<u32>(p[3]) << 24);
    };

    usize pos = 12;
    while (pos + 8 <= bytes.size()) {
        u32 size = le32(pos + 4);
        if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
            usize avail = std::min<usize>(size, bytes.size() - pos - 8);
            const auto* p =
                    reinterpret_cast<const unsigned char*>(bytes.data() + pos + 8);
            for (usize i = 0; i + 1 < avail; i += 2)
                samples.push_back(static_cast<i16>(p[i] | (p[i + 1] << 8)));
            break;
        }
        pos += 8 + size + (size & 1);
    }
    return samples;
}

inline f32 toFloat(i16 sample) {
    return static_cast<f32>(sample) / 32768.0f;
}

} // namespace mc::test
