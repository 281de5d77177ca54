#include "FileSink.hpp"
#include "core/Logger.hpp"

namespace mc {

namespace {
using SinkResult = Result<void, SinkError>;
}

FileSink::~FileSink() {
    if (state_ == State::Open) {
        if (auto res = finish(); !res) {
            LOG_WARN("FileSink {}: {}", path_.string(), res.error().message);
        }
    }
}

SinkResult FileSink::open(const fs::path& path, const AudioFormat& format) {
    if (state_ != State::Closed) {
        return SinkResult::err(
                {SinkError::Kind::NotReady, "Sink already opened: " + path_.string()});
    }

    if (auto res = writer_.open(path, format); !res) {
        return SinkResult::err({SinkError::Kind::OpenFailed, res.error().message});
    }

    path_ = path;
    format_ = format;
    framesWritten_ = 0;
    state_ = State::Open;
    LOG_DEBUG("FileSink opened: {}", path.string());
    return SinkResult::ok();
}

SinkResult FileSink::append(const SampleBuffer& buffer) {
    if (state_ != State::Open) {
        return SinkResult::err({SinkError::Kind::NotReady,
                                state_ == State::Closed ? "Sink not open"
                                                        : "Sink already finished"});
    }
    if (buffer.format() != format_) {
        return SinkResult::err(
                {SinkError::Kind::FormatMismatch,
                 "Buffer format does not match sink " + path_.string()});
    }

    if (auto res = writer_.writeInterleaved(buffer.samples()); !res) {
        return SinkResult::err({SinkError::Kind::WriteFailed, res.error().message});
    }
    framesWritten_ += buffer.frameCount();
    return SinkResult::ok();
}

SinkResult FileSink::finish() {
    if (finishResult_)
        return *finishResult_;

    if (state_ == State::Closed) {
        return SinkResult::err({SinkError::Kind::NotReady, "Sink not open"});
    }

    state_ = State::Finished;
    if (auto res = writer_.close(); !res) {
        finishResult_ =
                SinkResult::err({SinkError::Kind::FinishFailed, res.error().message});
    } else {
        finishResult_ = SinkResult::ok();
        LOG_DEBUG("FileSink finished: {} ({} frames, {:.2f}s)",
                  path_.string(),
                  framesWritten_,
                  durationWritten().count());
    }
    return *finishResult_;
}

} // namespace mc
