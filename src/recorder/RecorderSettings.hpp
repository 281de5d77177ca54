/**
 * @file RecorderSettings.hpp
 * @brief Explicit settings handed to the recorder at construction.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include "audio/AudioFormat.hpp"
#include "core/ConfigData.hpp"

namespace mc {

struct RecorderSettings {
    AudioFormat format;
    Seconds preBufferCapacity{30.0};
    fs::path outputDirectory;
    fs::path tempDirectory;
    usize deliveryQueueCapacity{256};

    static RecorderSettings fromConfig(const AudioConfig& audio,
                                       const RecordingConfig& recording);
};

} // namespace mc
