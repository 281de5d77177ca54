#include "RecordingNaming.hpp"
#include <ctime>

namespace mc::naming {

std::string sanitizeTitle(std::string_view title) {
    std::string out;
    out.reserve(title.size());
    for (char c : title) {
        switch (c) {
        case '/':
        case ':':
        case '\\':
        case '|':
            out += '-';
            break;
        case '?':
        case '*':
        case '<':
        case '>':
        case '"':
            break;
        default:
            out += c;
        }
    }

    if (out.size() > kMaxTitleLength) {
        std::size_t cut = kMaxTitleLength;
        // Back up over UTF-8 continuation bytes
        while (cut > 0 && (static_cast<unsigned char>(out[cut]) & 0xC0) == 0x80)
            --cut;
        out.resize(cut);
    }
    return out;
}

std::string timestamp(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d_%H-%M-%S", &tm);
    return buf;
}

std::string baseName(const std::optional<std::string>& meetingTitle,
                     std::chrono::system_clock::time_point when) {
    auto date = timestamp(when);
    if (meetingTitle) {
        auto title = sanitizeTitle(*meetingTitle);
        if (!title.empty())
            return date + "_" + title;
    }
    return "Recording_" + date;
}

fs::path audioPath(const fs::path& dir, std::string_view base) {
    return dir / (std::string(base) + std::string(kAudioExtension));
}

fs::path transcriptPath(const fs::path& audioFile) {
    return audioFile.parent_path() /
           (audioFile.stem().string() + std::string(kTranscriptSuffix));
}

fs::path summaryPath(const fs::path& audioFile) {
    return audioFile.parent_path() /
           (audioFile.stem().string() + std::string(kSummarySuffix));
}

fs::path systemTempPath(const fs::path& tempDir, std::string_view base) {
    return tempDir / (std::string(base) + std::string(kSystemTempSuffix));
}

fs::path microphoneTempPath(const fs::path& tempDir, std::string_view base) {
    return tempDir / (std::string(base) + std::string(kMicrophoneTempSuffix));
}

} // namespace mc::naming
