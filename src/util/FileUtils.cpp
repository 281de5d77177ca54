#include "FileUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/fmt/fmt.h>
#include "core/Logger.hpp"

namespace mc::file {

namespace {

constexpr std::string_view kAppDir = "meetcap";

fs::path homeDir() {
    if (const char* home = std::getenv("HOME"))
        return fs::path(home);
    return fs::current_path();
}

fs::path xdgDir(const char* var, std::string_view fallback) {
    if (const char* v = std::getenv(var); v && *v)
        return fs::path(v) / kAppDir;
    return homeDir() / fallback / kAppDir;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

fs::path dataDir() {
    return xdgDir("XDG_DATA_HOME", ".local/share");
}

fs::path documentsDir() {
    if (const char* v = std::getenv("XDG_DOCUMENTS_DIR"); v && *v)
        return fs::path(v);
    return homeDir() / "Documents";
}

fs::path tempDir() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec)
        dir = "/tmp";
    return dir / kAppDir;
}

bool ensureDir(const fs::path& dir) {
    if (dir.empty())
        return true;
    std::error_code ec;
    fs::create_directories(dir, ec);
    return !ec && fs::is_directory(dir);
}

fs::path expandPath(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/"))
        p = homeDir().string() + p.substr(1);
    return fs::path(p);
}

std::vector<fs::path> listFiles(const fs::path& dir,
                                const std::vector<std::string>& extensions,
                                bool recursive) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        return files;

    auto matches = [&](const fs::path& p) {
        auto ext = lower(p.extension().string());
        return extensions.empty() ||
               std::find(extensions.begin(), extensions.end(), ext) !=
                       extensions.end();
    };

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(dir, ec);
             !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            if (it->is_regular_file(ec) && matches(it->path()))
                files.push_back(it->path());
        }
    } else {
        for (auto it = fs::directory_iterator(dir, ec);
             !ec && it != fs::directory_iterator();
             it.increment(ec)) {
            if (it->is_regular_file(ec) && matches(it->path()))
                files.push_back(it->path());
        }
    }
    return files;
}

bool removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        LOG_WARN("Failed to remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

std::string formatDuration(Duration d) {
    auto total = std::chrono::duration_cast<std::chrono::seconds>(d).count();
    if (total < 0)
        total = 0;
    auto h = total / 3600;
    auto m = (total % 3600) / 60;
    auto s = total % 60;
    if (h > 0)
        return fmt::format("{}:{:02}:{:02}", h, m, s);
    return fmt::format("{}:{:02}", m, s);
}

} // namespace mc::file
