/**
 * @file Config.hpp
 * @brief Process-wide configuration store.
 *
 * Holds the AppConfig loaded at startup. Readers receive copies, so a value
 * handed to the recorder never changes underneath it. Only the application
 * shell uses this singleton; the recorder core is given explicit settings.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 *
 * @section Patterns
 * - Singleton: Global access point for configuration.
 * - Thread-Safe: Mutex-protected access to settings.
 */

#pragma once
#include <functional>
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace mc {

class Config {
public:
    static Config& instance();

    // Replaces the current values with the contents of `path`
    Result<void> load(const fs::path& path);

    // User config, else a copy of the installed template, else the built-in
    // defaults written out as the new user config
    Result<void> loadDefault();

    // Writes to the path last loaded from
    Result<void> save();

    AppConfig snapshot() const;
    void update(const std::function<void(AppConfig&)>& fn);

    bool debug() const;
    fs::path configPath() const;
    bool isDirty() const;

private:
    Config() = default;

    AppConfig config_;
    fs::path configPath_;
    bool dirty_{false};

    mutable std::mutex mutex_;
};

#define CONFIG mc::Config::instance()

} // namespace mc
