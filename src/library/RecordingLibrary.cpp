#include "RecordingLibrary.hpp"
#include <algorithm>
#include "audio/PcmFile.hpp"
#include "core/Logger.hpp"
#include "library/RecordingNaming.hpp"
#include "util/FileUtils.hpp"

namespace mc {

namespace {

bool isTemporaryCapture(const fs::path& path) {
    auto name = path.filename().string();
    return name.ends_with(naming::kSystemTempSuffix) ||
           name.ends_with(naming::kMicrophoneTempSuffix);
}

std::string stripAudioExtension(std::string name) {
    if (name.ends_with(naming::kAudioExtension))
        name.resize(name.size() - naming::kAudioExtension.size());
    return name;
}

std::vector<std::pair<fs::path, fs::path>> sidecarMoves(const fs::path& from,
                                                        const fs::path& to) {
    return {{naming::transcriptPath(from), naming::transcriptPath(to)},
            {naming::summaryPath(from), naming::summaryPath(to)}};
}

} // namespace

RecordingLibrary::RecordingLibrary(fs::path directory)
    : directory_(std::move(directory)) {}

std::vector<MixedRecording> RecordingLibrary::recordings() const {
    std::vector<MixedRecording> result;

    std::error_code ec;
    if (!fs::is_directory(directory_, ec))
        return result;

    for (const auto& path : file::listFiles(directory_, file::audioExtensions)) {
        if (isTemporaryCapture(path))
            continue;
        result.push_back(describe(path));
    }

    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        if (a.created != b.created)
            return a.created > b.created;
        return a.displayName > b.displayName;
    });

    LOG_DEBUG("RecordingLibrary: {} recordings in '{}'",
              result.size(),
              directory_.string());
    return result;
}

Result<MixedRecording> RecordingLibrary::find(const std::string& name) const {
    auto base = stripAudioExtension(name);
    auto path = naming::audioPath(directory_, base);

    std::error_code ec;
    if (base.empty() || !fs::is_regular_file(path, ec))
        return Result<MixedRecording>::err("No recording named '" + name + "'");
    return Result<MixedRecording>::ok(describe(path));
}

Result<void> RecordingLibrary::remove(const MixedRecording& recording) {
    std::error_code ec;
    if (!fs::is_regular_file(recording.path, ec)) {
        return Result<void>::err("Recording does not exist: " +
                                 recording.path.string());
    }

    if (!fs::remove(recording.path, ec) || ec) {
        return Result<void>::err("Could not delete " + recording.path.string() +
                                 ": " + ec.message());
    }

    for (const auto& sidecar : {naming::transcriptPath(recording.path),
                                naming::summaryPath(recording.path)}) {
        if (fs::exists(sidecar, ec))
            file::removeQuietly(sidecar);
    }

    LOG_INFO("Deleted recording '{}'", recording.displayName);
    return Result<void>::ok();
}

Result<MixedRecording> RecordingLibrary::rename(const MixedRecording& recording,
                                                const std::string& newName) {
    auto base = stripAudioExtension(newName);
    if (base.empty() || base.size() > 255 ||
        base.find_first_of("/\\:|?*<>\"") != std::string::npos) {
        return Result<MixedRecording>::err("Invalid recording name: '" +
                                           newName + "'");
    }

    std::error_code ec;
    if (!fs::is_regular_file(recording.path, ec)) {
        return Result<MixedRecording>::err("Recording does not exist: " +
                                           recording.path.string());
    }

    auto target = naming::audioPath(recording.path.parent_path(), base);
    if (target == recording.path)
        return Result<MixedRecording>::ok(describe(target));
    if (fs::exists(target, ec)) {
        return Result<MixedRecording>::err("A recording named '" + base +
                                           "' already exists");
    }

    fs::rename(recording.path, target, ec);
    if (ec) {
        return Result<MixedRecording>::err("Could not rename " +
                                           recording.path.string() + ": " +
                                           ec.message());
    }

    for (const auto& [from, to] : sidecarMoves(recording.path, target)) {
        if (!fs::exists(from, ec))
            continue;
        fs::rename(from, to, ec);
        if (ec) {
            LOG_WARN("Could not rename sidecar {}: {}", from.string(), ec.message());
        }
    }

    LOG_INFO("Renamed recording '{}' -> '{}'", recording.displayName, base);
    return Result<MixedRecording>::ok(describe(target));
}

MixedRecording RecordingLibrary::describe(const fs::path& path) const {
    MixedRecording rec;
    rec.path = path;
    rec.displayName = path.stem().string();

    std::error_code ec;
    auto written = fs::last_write_time(path, ec);
    if (!ec) {
        rec.created = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(written));
    }

    if (auto info = probePcmFile(path)) {
        rec.duration = Seconds(info->format.framesToSeconds(info->frames));
    } else {
        LOG_DEBUG("RecordingLibrary: no duration for '{}': {}",
                  path.string(),
                  info.error().message);
    }
    return rec;
}

} // namespace mc
