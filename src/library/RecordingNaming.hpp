/**
 * @file RecordingNaming.hpp
 * @brief File naming contract shared by the recorder and the library.
 *
 * Final recordings are `<base>.wav` where base is
 * `yyyy-MM-dd_HH-mm-ss_<title>` or `Recording_yyyy-MM-dd_HH-mm-ss`.
 * Transcript and summary sidecars are keyed by the same base name.
 */

#pragma once
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mc::naming {

namespace fs = std::filesystem;

inline constexpr std::string_view kAudioExtension = ".wav";
inline constexpr std::string_view kTranscriptSuffix = "_transcription.txt";
inline constexpr std::string_view kSummarySuffix = "_summary.json";
inline constexpr std::string_view kSystemTempSuffix = "_sys.wav";
inline constexpr std::string_view kMicrophoneTempSuffix = "_mic.wav";
inline constexpr std::size_t kMaxTitleLength = 50;

// Replaces path separators and reserved characters, truncates to
// kMaxTitleLength bytes without splitting a UTF-8 sequence.
std::string sanitizeTitle(std::string_view title);

std::string timestamp(std::chrono::system_clock::time_point when);

std::string baseName(const std::optional<std::string>& meetingTitle,
                     std::chrono::system_clock::time_point when =
                             std::chrono::system_clock::now());

fs::path audioPath(const fs::path& dir, std::string_view base);
fs::path transcriptPath(const fs::path& audioFile);
fs::path summaryPath(const fs::path& audioFile);
fs::path systemTempPath(const fs::path& tempDir, std::string_view base);
fs::path microphoneTempPath(const fs::path& tempDir, std::string_view base);

} // namespace mc::naming
