#include "ConfigParsers.hpp"
#include <algorithm>
#include "util/FileUtils.hpp"

namespace mc {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto val = node.value<double>())
                return static_cast<T>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return *val < 0 ? T{0} : static_cast<T>(*val);
        }
    }
    return defaultVal;
}
} // namespace

AppConfig ConfigParsers::parse(const toml::table& tbl) {
    AppConfig cfg;
    parseGeneral(tbl, cfg.general);
    parseAudio(tbl, cfg.audio);
    parseRecording(tbl, cfg.recording);
    return cfg;
}

void ConfigParsers::parseGeneral(const toml::table& tbl, GeneralConfig& cfg) {
    if (auto general = tbl["general"].as_table())
        cfg.debug = get(*general, "debug", cfg.debug);
}

void ConfigParsers::parseAudio(const toml::table& tbl, AudioConfig& cfg) {
    if (auto audio = tbl["audio"].as_table()) {
        cfg.sampleRate = std::clamp(
                get(*audio, "sample_rate", cfg.sampleRate), 8000u, 192000u);
        cfg.channels = std::clamp(get(*audio, "channels", cfg.channels), 1u, 8u);
        cfg.chunkFrames = std::clamp(
                get(*audio, "chunk_frames", cfg.chunkFrames), 64u, 96000u);
        cfg.systemDevice = get(*audio, "system_device", cfg.systemDevice);
        cfg.microphoneDevice =
                get(*audio, "microphone_device", cfg.microphoneDevice);
    }
}

void ConfigParsers::parseRecording(const toml::table& tbl,
                                   RecordingConfig& cfg) {
    if (auto rec = tbl["recording"].as_table()) {
        if (auto outDir = (*rec)["output_directory"].value<std::string>();
            outDir && !outDir->empty()) {
            cfg.outputDirectory = file::expandPath(*outDir);
        }
        // An explicit empty string selects the system temp dir
        if (auto tmpDir = (*rec)["temp_directory"].value<std::string>()) {
            cfg.tempDirectory =
                    tmpDir->empty() ? fs::path() : file::expandPath(*tmpDir);
        }
        cfg.preBufferSeconds = std::clamp(
                get(*rec, "pre_buffer_seconds", cfg.preBufferSeconds), 1.0, 600.0);
        cfg.deliveryQueueCapacity = std::clamp(
                get(*rec, "delivery_queue_capacity", cfg.deliveryQueueCapacity),
                8u,
                65536u);
        cfg.stopTimeoutMs = std::clamp(
                get(*rec, "stop_timeout_ms", cfg.stopTimeoutMs), 100u, 60000u);
    }
}

toml::table ConfigParsers::serialize(const AppConfig& cfg) {
    const auto& audio = cfg.audio;
    const auto& rec = cfg.recording;

    toml::table root;
    root.insert("general", toml::table{{"debug", cfg.general.debug}});
    root.insert("audio",
                toml::table{{"sample_rate", static_cast<i64>(audio.sampleRate)},
                            {"channels", static_cast<i64>(audio.channels)},
                            {"chunk_frames", static_cast<i64>(audio.chunkFrames)},
                            {"system_device", audio.systemDevice},
                            {"microphone_device", audio.microphoneDevice}});
    root.insert("recording",
                toml::table{{"output_directory", rec.outputDirectory.string()},
                            {"temp_directory", rec.tempDirectory.string()},
                            {"pre_buffer_seconds", rec.preBufferSeconds},
                            {"delivery_queue_capacity",
                             static_cast<i64>(rec.deliveryQueueCapacity)},
                            {"stop_timeout_ms", static_cast<i64>(rec.stopTimeoutMs)}});
    return root;
}

} // namespace mc
