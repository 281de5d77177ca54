#include "ConfigLoader.hpp"
#include <fstream>
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

Result<AppConfig> ConfigLoader::read(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return Result<AppConfig>::err("Config file not found: " + path.string());

    try {
        auto tbl = toml::parse_file(path.string());
        auto config = ConfigParsers::parse(tbl);
        if (config.recording.outputDirectory.empty())
            config.recording.outputDirectory = builtInDefaults().recording.outputDirectory;
        LOG_INFO("Config loaded from: {}", path.string());
        return Result<AppConfig>::ok(std::move(config));
    } catch (const toml::parse_error& err) {
        return Result<AppConfig>::err(fmt::format("Config parse error in {} ({}:{}): {}",
                                                  path.string(),
                                                  err.source().begin.line,
                                                  err.source().begin.column,
                                                  err.description()));
    }
}

Result<void> ConfigLoader::write(const AppConfig& config, const fs::path& path) {
    if (!file::ensureDir(path.parent_path())) {
        return Result<void>::err("Cannot create config directory " +
                                 path.parent_path().string());
    }

    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath);
        if (!out)
            return Result<void>::err("Failed to open " + tempPath.string());
        out << "# meetcap configuration\n\n" << ConfigParsers::serialize(config) << "\n";
        if (!out.flush())
            return Result<void>::err("Failed to write " + tempPath.string());
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        file::removeQuietly(tempPath);
        return Result<void>::err("Failed to save config to " + path.string() +
                                 ": " + ec.message());
    }

    LOG_DEBUG("Config saved to: {}", path.string());
    return Result<void>::ok();
}

fs::path ConfigLoader::userConfigPath() {
    return file::configDir() / "config.toml";
}

fs::path ConfigLoader::systemDefaultPath() {
    return "/usr/share/meetcap/config/default.toml";
}

AppConfig ConfigLoader::builtInDefaults() {
    AppConfig config;
    config.recording.outputDirectory = file::documentsDir() / "meetcap";
    return config;
}

} // namespace mc
