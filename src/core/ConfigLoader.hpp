/**
 * @file ConfigLoader.hpp
 * @brief Reads and writes config files.
 *
 * Writes go to `<file>.tmp` first and are renamed over the target, so an
 * interrupted save never leaves a truncated config behind.
 *
 * @section Dependencies
 * - ConfigParsers
 * - std::filesystem
 */

#pragma once
#include <filesystem>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace mc {

class ConfigLoader {
public:
    static Result<AppConfig> read(const fs::path& path);
    static Result<void> write(const AppConfig& config, const fs::path& path);

    // <config dir>/config.toml
    static fs::path userConfigPath();
    // Installed template copied to the user config on first run
    static fs::path systemDefaultPath();

    // Used when neither the user config nor the template exist
    static AppConfig builtInDefaults();
};

} // namespace mc
