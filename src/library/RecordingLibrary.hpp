/**
 * @file RecordingLibrary.hpp
 * @brief Finished recordings in the output directory.
 *
 * Lists, deletes and renames mixed recordings. Transcript and summary files
 * that share the recording's base name are treated as opaque sidecars and
 * follow the audio file on delete and rename.
 *
 * @section Dependencies
 * - PcmFile (duration probe)
 * - std::filesystem
 */

#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "library/MixedRecording.hpp"
#include "util/Result.hpp"

namespace mc {

class RecordingLibrary {
public:
    explicit RecordingLibrary(std::filesystem::path directory);

    // Newest first. Temporary capture files and partial mixes are skipped.
    std::vector<MixedRecording> recordings() const;

    // Looks a recording up by base name (with or without extension)
    Result<MixedRecording> find(const std::string& name) const;

    Result<void> remove(const MixedRecording& recording);
    Result<MixedRecording> rename(const MixedRecording& recording,
                                  const std::string& newName);

    const std::filesystem::path& directory() const {
        return directory_;
    }

private:
    MixedRecording describe(const std::filesystem::path& path) const;

    std::filesystem::path directory_;
};

} // namespace mc
