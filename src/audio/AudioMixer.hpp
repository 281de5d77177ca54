/**
 * @file AudioMixer.hpp
 * @brief Frame-aligned additive mixing of the system and microphone streams.
 *
 * Both inputs must share sample rate and channel count. The output is as long
 * as the longer input; the shorter one contributes silence past its end.
 * Samples are summed and hard-clipped to [-1, 1] with no gain staging, so loud
 * simultaneous speech can clip.
 *
 * @section Dependencies
 * - PcmFile (FFmpeg-backed WAV I/O)
 */

#pragma once
#include <filesystem>
#include <string>
#include "audio/PcmFile.hpp"
#include "util/Result.hpp"

namespace mc {

struct MixError {
    enum class Kind { FormatMismatch, SourceReadFailed, DestinationWriteFailed };

    Kind kind;
    std::string message;
};

const char* toString(MixError::Kind kind);

class AudioMixer {
public:
    // Reads both files, mixes them and writes `destination` in the same
    // format. The result is written beside the destination and renamed into
    // place, so a failed mix never leaves a partial file under that name.
    static Result<void, MixError> mix(const fs::path& systemFile,
                                      const fs::path& microphoneFile,
                                      const fs::path& destination);

    static Result<PcmData, MixError> mixBuffers(const PcmData& system,
                                                const PcmData& microphone);

private:
    static Result<void, MixError> mixFiles(const fs::path& systemFile,
                                           const fs::path& microphoneFile,
                                           const fs::path& destination);
};

} // namespace mc
