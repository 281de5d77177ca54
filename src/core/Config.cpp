#include "Config.hpp"
#include "ConfigLoader.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    auto loaded = ConfigLoader::read(path);
    if (!loaded)
        return Result<void>::err(loaded.error());

    std::lock_guard lock(mutex_);
    config_ = std::move(*loaded);
    configPath_ = path;
    dirty_ = false;
    return Result<void>::ok();
}

Result<void> Config::loadDefault() {
    auto userPath = ConfigLoader::userConfigPath();

    std::error_code ec;
    if (!fs::exists(userPath, ec)) {
        auto systemPath = ConfigLoader::systemDefaultPath();
        if (fs::exists(systemPath, ec) && file::ensureDir(userPath.parent_path())) {
            fs::copy_file(systemPath, userPath, ec);
            if (ec) {
                LOG_WARN("Could not copy {}: {}", systemPath.string(), ec.message());
            }
        }
    }

    if (fs::exists(userPath, ec))
        return load(userPath);

    LOG_WARN("No config file found, using built-in defaults");
    auto defaults = ConfigLoader::builtInDefaults();
    {
        std::lock_guard lock(mutex_);
        config_ = defaults;
        configPath_ = userPath;
        dirty_ = false;
    }
    if (auto res = ConfigLoader::write(defaults, userPath); !res) {
        LOG_WARN("Could not write default config: {}", res.error().message);
    }
    return Result<void>::ok();
}

Result<void> Config::save() {
    AppConfig copy;
    fs::path path;
    {
        std::lock_guard lock(mutex_);
        copy = config_;
        path = configPath_;
    }
    if (path.empty())
        path = ConfigLoader::userConfigPath();

    auto res = ConfigLoader::write(copy, path);
    if (res) {
        std::lock_guard lock(mutex_);
        dirty_ = false;
    }
    return res;
}

AppConfig Config::snapshot() const {
    std::lock_guard lock(mutex_);
    return config_;
}

void Config::update(const std::function<void(AppConfig&)>& fn) {
    std::lock_guard lock(mutex_);
    fn(config_);
    dirty_ = true;
}

bool Config::debug() const {
    std::lock_guard lock(mutex_);
    return config_.general.debug;
}

fs::path Config::configPath() const {
    std::lock_guard lock(mutex_);
    return configPath_;
}

bool Config::isDirty() const {
    std::lock_guard lock(mutex_);
    return dirty_;
}

} // namespace mc
