/**
 * @file FileSink.hpp
 * @brief Append-only WAV writer for one captured stream.
 *
 * A FileSink is opened once, receives buffers in capture order and is
 * finished exactly once. finish() is idempotent and returns the result of
 * the first call. Appends outside the open..finish window fail with
 * NotReady.
 *
 * Not thread-safe; the coordinator thread is its only caller.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "audio/PcmFile.hpp"
#include "audio/SampleBuffer.hpp"
#include "util/Result.hpp"

namespace mc {

struct SinkError {
    enum class Kind { NotReady, OpenFailed, FormatMismatch, WriteFailed, FinishFailed };

    Kind kind;
    std::string message;
};

class FileSink {
public:
    enum class State { Closed, Open, Finished };

    FileSink() = default;
    ~FileSink();

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    Result<void, SinkError> open(const fs::path& path, const AudioFormat& format);
    Result<void, SinkError> append(const SampleBuffer& buffer);
    Result<void, SinkError> finish();

    bool isReady() const {
        return state_ == State::Open;
    }
    State state() const {
        return state_;
    }
    const fs::path& path() const {
        return path_;
    }
    u64 framesWritten() const {
        return framesWritten_;
    }
    Seconds durationWritten() const {
        return Seconds(format_.framesToSeconds(framesWritten_));
    }

private:
    State state_{State::Closed};
    fs::path path_;
    AudioFormat format_;
    WavWriter writer_;
    u64 framesWritten_{0};
    std::optional<Result<void, SinkError>> finishResult_;
};

} // namespace mc
