#include "CaptureSession.hpp"
#include "core/Logger.hpp"
#include "library/RecordingNaming.hpp"
#include "recorder/Coordinator.hpp"
#include "util/FileUtils.hpp"

namespace mc {

CaptureSession::CaptureSession(u64 id,
                               SessionSettings settings,
                               std::string baseName,
                               CaptureSourceFactory factory,
                               Coordinator& coordinator,
                               SourceFailureHandler onSourceFailure)
    : id_(id),
      settings_(std::move(settings)),
      baseName_(std::move(baseName)),
      factory_(std::move(factory)),
      coordinator_(coordinator),
      onSourceFailure_(std::move(onSourceFailure)) {
    for (auto kind : {SourceKind::System, SourceKind::Microphone}) {
        channel(kind).ring = PreBufferRing(settings_.preBufferCapacity);
    }
    channel(SourceKind::System).tempPath =
            naming::systemTempPath(settings_.tempDirectory, baseName_);
    channel(SourceKind::Microphone).tempPath =
            naming::microphoneTempPath(settings_.tempDirectory, baseName_);
}

CaptureSession::~CaptureSession() {
    stopSources();
}

Result<StartReport> CaptureSession::start(Routing mode) {
    if (mode == Routing::Record) {
        if (auto res = openSinks(); !res)
            return Result<StartReport>::err(res.error());
    }
    routing_ = mode;

    if (auto res = startSource(SourceKind::System); !res) {
        routing_ = Routing::Discard;
        releaseSinks();
        return Result<StartReport>::err(res.error());
    }

    StartReport report;
    if (auto res = startSource(SourceKind::Microphone); !res) {
        report.microphoneAvailable = false;
        report.microphoneError = res.error().message;
        LOG_WARN("Session {}: microphone unavailable, continuing with system "
                 "audio only: {}",
                 id_,
                 report.microphoneError);
    }

    LOG_INFO("Session {} started ({})",
             id_,
             mode == Routing::Record ? "recording" : "pre-buffering");
    return Result<StartReport>::ok(report);
}

Result<void> CaptureSession::beginRecording() {
    if (routing_ != Routing::PreBuffer)
        return Result<void>::err("Session is not pre-buffering");

    if (auto res = openSinks(); !res)
        return res;

    for (auto kind : {SourceKind::System, SourceKind::Microphone}) {
        auto& ch = channel(kind);
        auto buffered = ch.ring.duration();
        auto buffers = ch.ring.drainAll();
        for (auto& buffer : buffers)
            route(kind, std::move(buffer), Routing::Record);
        LOG_INFO("Session {}: flushed {:.2f}s of pre-buffered {} audio",
                 id_,
                 buffered.count(),
                 toString(kind));
    }

    routing_ = Routing::Record;
    return Result<void>::ok();
}

CaptureOutputs CaptureSession::stop() {
    stopSources();
    routing_ = Routing::Discard;

    CaptureOutputs out;
    out.rejectedBuffers = rejected_;
    for (auto kind : {SourceKind::System, SourceKind::Microphone}) {
        auto& ch = channel(kind);
        if (ch.sink.state() == FileSink::State::Closed)
            continue;
        if (auto res = ch.sink.finish(); !res && out.finishError.empty())
            out.finishError = res.error().message;
    }

    const auto& sys = channel(SourceKind::System);
    const auto& mic = channel(SourceKind::Microphone);
    if (sys.sink.state() == FileSink::State::Finished) {
        out.systemFile = sys.tempPath;
        out.systemDuration = sys.sink.durationWritten();
    }
    if (mic.sink.state() == FileSink::State::Finished) {
        out.microphoneFile = mic.tempPath;
        out.microphoneDuration = mic.sink.durationWritten();
    }

    LOG_INFO("Session {} stopped: system {:.2f}s, microphone {:.2f}s",
             id_,
             out.systemDuration.count(),
             out.microphoneDuration.count());
    return out;
}

void CaptureSession::cancel() {
    routing_ = Routing::Discard;
    stopSources();
    for (auto& ch : channels_)
        ch.ring.discard();
    releaseSinks();
    LOG_INFO("Session {} cancelled", id_);
}

void CaptureSession::stopSource(SourceKind kind) {
    auto& ch = channel(kind);
    if (ch.source) {
        ch.source->stop();
        ch.source.reset();
    }
}

void CaptureSession::route(SourceKind kind, SampleBuffer&& buffer) {
    route(kind, std::move(buffer), routing_);
}

void CaptureSession::route(SourceKind kind,
                           SampleBuffer&& buffer,
                           Routing target) {
    auto& ch = channel(kind);
    switch (target) {
    case Routing::PreBuffer:
        ch.ring.push(std::move(buffer));
        break;
    case Routing::Record:
        if (auto res = ch.sink.append(buffer); !res) {
            ++rejected_;
            if (!ch.sinkErrorLogged) {
                LOG_ERROR("Session {}: {} sink rejected audio: {}",
                          id_,
                          toString(kind),
                          res.error().message);
                ch.sinkErrorLogged = true;
            }
        }
        break;
    case Routing::Discard:
        break;
    }
}

bool CaptureSession::microphoneActive() const {
    const auto& source = channel(SourceKind::Microphone).source;
    return source && source->isRunning();
}

Seconds CaptureSession::bufferedDuration(SourceKind kind) const {
    return channel(kind).ring.duration();
}

Seconds CaptureSession::recordedDuration(SourceKind kind) const {
    return channel(kind).sink.durationWritten();
}

Result<void> CaptureSession::openSinks() {
    if (!file::ensureDir(settings_.tempDirectory)) {
        return Result<void>::err("Cannot create temporary directory " +
                                 settings_.tempDirectory.string());
    }

    for (auto kind : {SourceKind::System, SourceKind::Microphone}) {
        auto& ch = channel(kind);
        file::removeQuietly(ch.tempPath);
        if (auto res = ch.sink.open(ch.tempPath, settings_.format); !res) {
            releaseSinks();
            return Result<void>::err("Cannot open " + std::string(toString(kind)) +
                                     " sink: " + res.error().message);
        }
    }
    return Result<void>::ok();
}

Result<void> CaptureSession::startSource(SourceKind kind) {
    auto source = factory_ ? factory_(kind) : nullptr;
    if (!source) {
        return Result<void>::err(std::string("No ") + toString(kind) +
                                 " capture source available");
    }

    auto& coordinator = coordinator_;
    auto id = id_;
    auto onBuffer = [&coordinator, id, kind](SampleBuffer&& buffer) {
        if (!coordinator.deliver(Delivery{id, kind, std::move(buffer)})) {
            LOG_TRACE("Delivery queue full, dropped {} buffer", toString(kind));
        }
    };
    auto onFailure = [handler = onSourceFailure_, id, kind](
                             const std::string& message) {
        if (handler)
            handler(id, kind, message);
    };

    if (auto res = source->start(onBuffer, onFailure); !res) {
        LOG_WARN("Session {}: {} source failed to start: {}",
                 id_,
                 toString(kind),
                 res.error().message);
        return res;
    }

    channel(kind).source = std::move(source);
    return Result<void>::ok();
}

void CaptureSession::stopSources() {
    for (auto kind : {SourceKind::System, SourceKind::Microphone})
        stopSource(kind);
    // Buffers queued before the sources stopped are routed now
    if (coordinator_.isWorkerThread())
        coordinator_.drainDeliveries();
}

void CaptureSession::releaseSinks() {
    for (auto& ch : channels_) {
        if (ch.sink.state() == FileSink::State::Open) {
            if (auto res = ch.sink.finish(); !res) {
                LOG_DEBUG("Discarded sink did not finish cleanly: {}",
                          res.error().message);
            }
        }
        if (ch.sink.state() != FileSink::State::Closed)
            file::removeQuietly(ch.tempPath);
    }
}

} // namespace mc
