/**
 * @file CaptureSession.hpp
 * @brief Owns the two capture sources of one recording and routes their
 * buffers.
 *
 * Each inbound buffer is routed according to the session's routing mode at
 * the moment it is handled: into a per-source PreBufferRing while
 * pre-buffering, into a per-source FileSink while recording, or dropped once
 * the session is being torn down. A session is built for one recording and
 * never reused.
 *
 * Every method except the capture callbacks runs on the coordinator thread.
 *
 * @section Patterns
 * - Demultiplexer: two asynchronous producers, one serialized consumer.
 */

#pragma once
#include <array>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "audio/PreBufferRing.hpp"
#include "capture/CaptureSource.hpp"
#include "recorder/FileSink.hpp"
#include "util/Result.hpp"

namespace mc {

class Coordinator;

enum class Routing { PreBuffer, Record, Discard };

struct SessionSettings {
    AudioFormat format;
    Seconds preBufferCapacity{30.0};
    fs::path tempDirectory;
};

struct StartReport {
    bool microphoneAvailable{true};
    std::string microphoneError;
};

struct CaptureOutputs {
    fs::path systemFile;
    fs::path microphoneFile;
    Seconds systemDuration{0.0};
    Seconds microphoneDuration{0.0};
    u64 rejectedBuffers{0};
    std::string finishError; // first sink finish failure, if any
};

class CaptureSession {
public:
    using SourceFailureHandler =
            std::function<void(u64 sessionId, SourceKind, const std::string&)>;

    CaptureSession(u64 id,
                   SessionSettings settings,
                   std::string baseName,
                   CaptureSourceFactory factory,
                   Coordinator& coordinator,
                   SourceFailureHandler onSourceFailure);
    ~CaptureSession();

    CaptureSession(const CaptureSession&) = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // Opens sinks first when `mode` is Record, then the sources. Fails when
    // the system source (or a sink) cannot be acquired; a missing microphone
    // is reported in the StartReport and recording continues without it.
    Result<StartReport> start(Routing mode);

    // Opens the sinks, flushes both rings into them oldest-first and routes
    // all further buffers to the sinks.
    Result<void> beginRecording();

    // Stops sources, routes what was already delivered, finalizes sinks.
    CaptureOutputs stop();

    // Stops sources and throws away everything buffered. Writes nothing.
    void cancel();

    // Stops one source after it failed mid-stream.
    void stopSource(SourceKind kind);

    void route(SourceKind kind, SampleBuffer&& buffer);

    u64 id() const {
        return id_;
    }
    Routing routing() const {
        return routing_;
    }
    const std::string& baseName() const {
        return baseName_;
    }
    bool microphoneActive() const;
    Seconds bufferedDuration(SourceKind kind) const;
    Seconds recordedDuration(SourceKind kind) const;
    u64 rejectedBuffers() const {
        return rejected_;
    }

private:
    struct Channel {
        std::unique_ptr<CaptureSource> source;
        PreBufferRing ring;
        FileSink sink;
        fs::path tempPath;
        bool sinkErrorLogged{false};
    };

    Channel& channel(SourceKind kind) {
        return channels_[static_cast<usize>(kind)];
    }
    const Channel& channel(SourceKind kind) const {
        return channels_[static_cast<usize>(kind)];
    }

    void route(SourceKind kind, SampleBuffer&& buffer, Routing target);
    Result<void> openSinks();
    Result<void> startSource(SourceKind kind);
    void stopSources();
    void releaseSinks();

    u64 id_;
    SessionSettings settings_;
    std::string baseName_;
    CaptureSourceFactory factory_;
    Coordinator& coordinator_;
    SourceFailureHandler onSourceFailure_;

    Routing routing_{Routing::Discard};
    std::array<Channel, 2> channels_;
    u64 rejected_{0};
};

} // namespace mc
