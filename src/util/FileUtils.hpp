/**
 * @file FileUtils.hpp
 * @brief Filesystem helpers: XDG directories, listing and path expansion.
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "util/Types.hpp"

namespace mc::file {

namespace fs = std::filesystem;

inline const std::vector<std::string> audioExtensions{".wav"};

// XDG base directories with the application subdirectory appended
fs::path configDir();
fs::path cacheDir();
fs::path dataDir();
fs::path documentsDir();
fs::path tempDir();

// Creates the directory (and parents). Returns false on failure.
bool ensureDir(const fs::path& dir);

// Expands a leading "~/" to $HOME
fs::path expandPath(std::string_view path);

std::vector<fs::path> listFiles(const fs::path& dir,
                                const std::vector<std::string>& extensions,
                                bool recursive = false);

// Removes a file, logging instead of throwing. Returns false on failure.
bool removeQuietly(const fs::path& path);

// "h:mm:ss" or "m:ss"
std::string formatDuration(Duration d);

} // namespace mc::file
