#include "AudioMixer.hpp"
#include <algorithm>
#include <new>
#include "core/Logger.hpp"
#include "util/FileUtils.hpp"

namespace mc {

namespace {

using MixResult = Result<void, MixError>;

MixResult fail(MixError::Kind kind, std::string message) {
    LOG_ERROR("AudioMixer: {}", message);
    return MixResult::err(MixError{kind, std::move(message)});
}

} // namespace

const char* toString(MixError::Kind kind) {
    switch (kind) {
    case MixError::Kind::FormatMismatch:
        return "format mismatch";
    case MixError::Kind::SourceReadFailed:
        return "source read failed";
    case MixError::Kind::DestinationWriteFailed:
        return "destination write failed";
    }
    return "unknown";
}

Result<PcmData, MixError> AudioMixer::mixBuffers(const PcmData& system,
                                                 const PcmData& microphone) {
    if (system.format != microphone.format ||
        system.channels.size() != microphone.channels.size()) {
        return Result<PcmData, MixError>::err(MixError{
                MixError::Kind::FormatMismatch,
                fmt::format("system is {} Hz/{} ch, microphone is {} Hz/{} ch",
                            system.format.sampleRate,
                            system.format.channels,
                            microphone.format.sampleRate,
                            microphone.format.channels)});
    }

    const usize sysFrames = system.frames();
    const usize micFrames = microphone.frames();
    const usize frames = std::max(sysFrames, micFrames);

    PcmData out = PcmData::silence(system.format, frames);
    for (usize c = 0; c < out.channels.size(); ++c) {
        auto& dst = out.channels[c];
        const auto& sys = system.channels[c];
        const auto& mic = microphone.channels[c];
        for (usize f = 0; f < frames; ++f) {
            f32 mixed = 0.0f;
            if (f < sysFrames)
                mixed += sys[f];
            if (f < micFrames)
                mixed += mic[f];
            dst[f] = std::clamp(mixed, -1.0f, 1.0f);
        }
    }
    return Result<PcmData, MixError>::ok(std::move(out));
}

Result<void, MixError> AudioMixer::mix(const fs::path& systemFile,
                                       const fs::path& microphoneFile,
                                       const fs::path& destination) {
    LOG_INFO("Mixing {} + {} -> {}",
             systemFile.filename().string(),
             microphoneFile.filename().string(),
             destination.string());

    // Both inputs and the output are held in memory as float
    try {
        return mixFiles(systemFile, microphoneFile, destination);
    } catch (const std::bad_alloc&) {
        fs::path partial = destination;
        partial += ".part";
        file::removeQuietly(partial);
        return fail(MixError::Kind::SourceReadFailed,
                    "Out of memory while mixing " + systemFile.string() +
                            " and " + microphoneFile.string());
    }
}

Result<void, MixError> AudioMixer::mixFiles(const fs::path& systemFile,
                                            const fs::path& microphoneFile,
                                            const fs::path& destination) {
    auto system = readPcmFile(systemFile);
    if (!system)
        return fail(MixError::Kind::SourceReadFailed, system.error().message);

    auto microphone = readPcmFile(microphoneFile);
    if (!microphone)
        return fail(MixError::Kind::SourceReadFailed,
                    microphone.error().message);

    auto mixed = mixBuffers(*system, *microphone);
    if (!mixed)
        return fail(mixed.error().kind, mixed.error().message);

    LOG_DEBUG("Mixed {} frames (system {}, microphone {})",
              mixed->frames(),
              system->frames(),
              microphone->frames());

    fs::path partial = destination;
    partial += ".part";

    {
        WavWriter writer;
        auto res = writer.open(partial, mixed->format);
        if (res)
            res = writer.writePlanar(*mixed);
        auto closed = writer.close();
        if (res && !closed)
            res = closed;
        if (!res) {
            file::removeQuietly(partial);
            return fail(MixError::Kind::DestinationWriteFailed,
                        res.error().message);
        }
    }

    std::error_code ec;
    fs::rename(partial, destination, ec);
    if (ec) {
        file::removeQuietly(partial);
        return fail(MixError::Kind::DestinationWriteFailed,
                    "Could not move mix into place at " + destination.string() +
                            ": " + ec.message());
    }

    LOG_INFO("Mix written: {} ({:.1f}s)", destination.string(), mixed->seconds());
    return MixResult::ok();
}

} // namespace mc
