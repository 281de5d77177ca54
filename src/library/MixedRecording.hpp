#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include "util/Types.hpp"

namespace mc {

// A finished, mixed recording on disk
struct MixedRecording {
    std::filesystem::path path;
    std::chrono::system_clock::time_point created;
    std::string displayName;
    Seconds duration{0.0};
};

} // namespace mc
