/**
 * @file ConfigParsers.hpp
 * @brief Conversion between TOML tables and AppConfig.
 *
 * Missing keys keep their current value; out-of-range numbers are clamped
 * rather than rejected, so a hand-edited file never stops the recorder from
 * starting.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace mc {

class ConfigParsers {
public:
    // Built-in defaults overlaid with whatever `tbl` provides
    static AppConfig parse(const toml::table& tbl);

    static void parseGeneral(const toml::table& tbl, GeneralConfig& cfg);
    static void parseAudio(const toml::table& tbl, AudioConfig& cfg);
    static void parseRecording(const toml::table& tbl, RecordingConfig& cfg);

    static toml::table serialize(const AppConfig& cfg);
};

} // namespace mc
