/**
 * @file ConfigData.hpp
 * @brief Plain configuration values, one struct per TOML table.
 *
 * Defaults here are the built-in configuration used when no file exists.
 */

#pragma once
#include <filesystem>
#include <string>
#include "util/Types.hpp"

namespace mc {

namespace fs = std::filesystem;

// [general]
struct GeneralConfig {
    bool debug{false};
};

// [audio] capture format and devices
struct AudioConfig {
    u32 sampleRate{48000};
    u32 channels{2};
    u32 chunkFrames{4800};
    std::string systemDevice{"@DEFAULT_MONITOR@"};
    std::string microphoneDevice{"@DEFAULT_SOURCE@"};
};

// [recording] pipeline and output locations
struct RecordingConfig {
    fs::path outputDirectory;
    fs::path tempDirectory; // empty = system temp dir
    f64 preBufferSeconds{30.0};
    u32 deliveryQueueCapacity{256};
    u32 stopTimeoutMs{2000};
};

struct AppConfig {
    GeneralConfig general;
    AudioConfig audio;
    RecordingConfig recording;
};

} // namespace mc
