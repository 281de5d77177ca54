#include "RecordingStateMachine.hpp"
#include <algorithm>
#include "audio/AudioMixer.hpp"
#include "core/Logger.hpp"
#include "library/RecordingNaming.hpp"
#include "util/FileUtils.hpp"

namespace mc {

const char* toString(RecorderState state) {
    switch (state) {
    case RecorderState::Idle:
        return "idle";
    case RecorderState::PreBuffering:
        return "pre-buffering";
    case RecorderState::Recording:
        return "recording";
    case RecorderState::Finalizing:
        return "finalizing";
    case RecorderState::Failed:
        return "failed";
    }
    return "unknown";
}

const char* toString(RecorderError::Kind kind) {
    switch (kind) {
    case RecorderError::Kind::Acquisition:
        return "acquisition";
    case RecorderError::Kind::Degraded:
        return "degraded";
    case RecorderError::Kind::MidStream:
        return "mid-stream";
    case RecorderError::Kind::Mixing:
        return "mixing";
    case RecorderError::Kind::Cleanup:
        return "cleanup";
    }
    return "unknown";
}

RecordingStateMachine::RecordingStateMachine(RecorderSettings settings,
                                             CaptureSourceFactory sourceFactory)
    : settings_(std::move(settings)),
      sourceFactory_(std::move(sourceFactory)),
      coordinator_(std::make_unique<Coordinator>(
              settings_.deliveryQueueCapacity,
              [this](Delivery&& d) { onDelivery(std::move(d)); })) {}

RecordingStateMachine::~RecordingStateMachine() {
    coordinator_->invoke([this] {
        if (state_ == RecorderState::Recording) {
            LOG_INFO("Shutting down while recording, finalizing");
            if (auto res = finalizeSession(); !res) {
                LOG_WARN("Final recording incomplete: {}", res.error().message);
            }
        } else if (session_) {
            session_->cancel();
        }
        session_.reset();
    });
}

Result<void> RecordingStateMachine::startPreBuffering(
        std::optional<std::string> meetingTitle) {
    return coordinator_->invoke([&]() -> Result<void> {
        auto current = state_.load();
        if (current != RecorderState::Idle && current != RecorderState::Failed) {
            LOG_WARN("Pre-buffering rejected: recorder is {}", toString(current));
            return Result<void>::err(std::string("Cannot pre-buffer while ") +
                                     toString(current));
        }

        LOG_INFO("Starting pre-buffering ({:.0f}s)",
                 settings_.preBufferCapacity.count());
        if (auto res = openSession(Routing::PreBuffer, std::move(meetingTitle));
            !res)
            return res;

        setState(RecorderState::PreBuffering);
        return Result<void>::ok();
    });
}

Result<void> RecordingStateMachine::confirm() {
    return coordinator_->invoke([&]() -> Result<void> {
        switch (state_.load()) {
        case RecorderState::Idle:
        case RecorderState::Failed:
            LOG_INFO("Confirm without pre-buffer, starting a normal recording");
            return doStartRecording(std::nullopt);
        case RecorderState::Recording:
            LOG_INFO("Confirm ignored: already recording");
            return Result<void>::ok();
        case RecorderState::Finalizing:
            return Result<void>::err("Cannot confirm while finalizing");
        case RecorderState::PreBuffering:
            break;
        }

        LOG_INFO("Recording confirmed, keeping pre-buffered audio");
        if (auto res = session_->beginRecording(); !res) {
            session_->cancel();
            session_.reset();
            raise(RecorderError::Kind::Acquisition, res.error().message);
            setState(RecorderState::Idle);
            return res;
        }

        setState(RecorderState::Recording);
        return Result<void>::ok();
    });
}

Result<void> RecordingStateMachine::cancel() {
    return coordinator_->invoke([&]() -> Result<void> {
        auto current = state_.load();
        if (current == RecorderState::Idle || current == RecorderState::Failed)
            return Result<void>::ok();
        if (current != RecorderState::PreBuffering) {
            return Result<void>::err(std::string("Nothing to cancel while ") +
                                     toString(current));
        }

        LOG_INFO("Pre-buffer cancelled, discarding captured audio");
        session_->cancel();
        session_.reset();
        setState(RecorderState::Idle);
        return Result<void>::ok();
    });
}

Result<void> RecordingStateMachine::startRecording(
        std::optional<std::string> meetingTitle) {
    return coordinator_->invoke([&]() -> Result<void> {
        return doStartRecording(std::move(meetingTitle));
    });
}

Result<void> RecordingStateMachine::stopRecording() {
    return coordinator_->invoke([&]() -> Result<void> {
        if (state_ != RecorderState::Recording) {
            LOG_INFO("Stop ignored: recorder is {}", toString(state_.load()));
            return Result<void>::ok();
        }

        setState(RecorderState::Finalizing);
        auto result = finalizeSession();
        setState(RecorderState::Idle);
        return result;
    });
}

std::optional<RecorderError> RecordingStateMachine::lastError() const {
    std::lock_guard lock(observableMutex_);
    return lastError_;
}

std::optional<MixedRecording> RecordingStateMachine::lastRecording() const {
    std::lock_guard lock(observableMutex_);
    return lastRecording_;
}

Seconds RecordingStateMachine::preBufferedDuration() {
    return coordinator_->invoke([this] {
        return session_ ? session_->bufferedDuration(SourceKind::System)
                        : Seconds(0.0);
    });
}

Seconds RecordingStateMachine::recordedDuration() {
    return coordinator_->invoke([this] {
        return session_ ? session_->recordedDuration(SourceKind::System)
                        : Seconds(0.0);
    });
}

bool RecordingStateMachine::microphoneActive() {
    return coordinator_->invoke(
            [this] { return session_ && session_->microphoneActive(); });
}

u64 RecordingStateMachine::droppedBuffers() const {
    return coordinator_->droppedDeliveries();
}

Result<void> RecordingStateMachine::doStartRecording(
        std::optional<std::string> meetingTitle) {
    auto current = state_.load();
    if (current == RecorderState::Recording) {
        LOG_INFO("Already recording, start request ignored");
        return Result<void>::ok();
    }
    if (current != RecorderState::Idle && current != RecorderState::Failed) {
        LOG_WARN("Recording rejected: recorder is {}", toString(current));
        return Result<void>::err(std::string("Cannot start recording while ") +
                                 toString(current));
    }

    LOG_INFO("Starting recording");
    if (auto res = openSession(Routing::Record, std::move(meetingTitle)); !res)
        return res;

    setState(RecorderState::Recording);
    return Result<void>::ok();
}

Result<void> RecordingStateMachine::openSession(Routing mode,
                                                std::optional<std::string> title) {
    clearError();
    if (state_ == RecorderState::Failed)
        setState(RecorderState::Idle);

    auto id = nextSessionId_++;
    auto* coordinator = coordinator_.get();
    auto failureHandler = [this, coordinator](u64 sessionId,
                                              SourceKind kind,
                                              const std::string& message) {
        // Capture thread: hand over to the coordinator
        coordinator->post([this, sessionId, kind, message] {
            onSourceFailure(sessionId, kind, message);
        });
    };

    session_ = std::make_unique<CaptureSession>(
            id,
            SessionSettings{settings_.format,
                            settings_.preBufferCapacity,
                            settings_.tempDirectory},
            naming::baseName(title),
            sourceFactory_,
            *coordinator_,
            failureHandler);

    auto started = session_->start(mode);
    if (!started) {
        session_.reset();
        raise(RecorderError::Kind::Acquisition, started.error().message);
        return Result<void>::err(started.error());
    }

    if (!started->microphoneAvailable) {
        raise(RecorderError::Kind::Degraded,
              "Microphone unavailable, recording system audio only: " +
                      started->microphoneError);
    }
    return Result<void>::ok();
}

Result<void> RecordingStateMachine::finalizeSession() {
    auto outputs = session_->stop();
    auto baseName = session_->baseName();
    session_.reset();

    if (auto dropped = coordinator_->droppedDeliveries(); dropped > 0) {
        LOG_WARN("{} buffers were dropped because the delivery queue was full",
                 dropped);
    }
    if (outputs.rejectedBuffers > 0) {
        LOG_WARN("{} buffers could not be written", outputs.rejectedBuffers);
    }
    if (!outputs.finishError.empty()) {
        LOG_WARN("Temporary file did not finalize cleanly: {}",
                 outputs.finishError);
    }

    if (outputs.systemFile.empty() || outputs.microphoneFile.empty()) {
        auto msg = std::string("No finalized audio to mix");
        raise(RecorderError::Kind::Mixing, msg);
        return Result<void>::err(msg);
    }

    if (!file::ensureDir(settings_.outputDirectory)) {
        auto msg = "Cannot create output directory " +
                   settings_.outputDirectory.string();
        raise(RecorderError::Kind::Mixing, msg);
        LOG_WARN("Temporary files kept: {}, {}",
                 outputs.systemFile.string(),
                 outputs.microphoneFile.string());
        return Result<void>::err(msg);
    }

    auto destination = naming::audioPath(settings_.outputDirectory, baseName);
    auto mixed = AudioMixer::mix(
            outputs.systemFile, outputs.microphoneFile, destination);
    if (!mixed) {
        auto msg = std::string("Failed to mix audio (") +
                   toString(mixed.error().kind) + "): " + mixed.error().message;
        raise(RecorderError::Kind::Mixing, msg);
        LOG_WARN("Temporary files kept for recovery: {}, {}",
                 outputs.systemFile.string(),
                 outputs.microphoneFile.string());
        return Result<void>::err(msg);
    }

    removeTemporaryFile(outputs.systemFile);
    removeTemporaryFile(outputs.microphoneFile);

    MixedRecording recording;
    recording.path = destination;
    recording.created = std::chrono::system_clock::now();
    recording.displayName = destination.stem().string();
    recording.duration = std::max(outputs.systemDuration, outputs.microphoneDuration);
    {
        std::lock_guard lock(observableMutex_);
        lastRecording_ = recording;
    }

    LOG_INFO("Recording saved: {} ({:.1f}s)",
             destination.string(),
             recording.duration.count());
    recordingFinished.emitSignal(recording);
    return Result<void>::ok();
}

void RecordingStateMachine::onSourceFailure(u64 sessionId,
                                            SourceKind kind,
                                            const std::string& message) {
    if (!session_ || session_->id() != sessionId) {
        LOG_DEBUG("Ignoring failure from finished session {}", sessionId);
        return;
    }

    if (kind == SourceKind::Microphone) {
        session_->stopSource(SourceKind::Microphone);
        raise(RecorderError::Kind::MidStream,
              "Microphone capture stopped, continuing with system audio "
              "only: " + message);
        return;
    }

    auto current = state_.load();
    LOG_ERROR("System audio capture failed while {}: {}",
              toString(current),
              message);

    if (current == RecorderState::Recording) {
        // Keep whatever was captured
        setState(RecorderState::Finalizing);
        if (auto res = finalizeSession(); !res) {
            LOG_WARN("Partial recording could not be saved: {}",
                     res.error().message);
        }
    } else {
        session_->cancel();
        session_.reset();
    }

    raise(RecorderError::Kind::MidStream,
          "System audio capture stopped unexpectedly: " + message);
    setState(RecorderState::Failed);
}

void RecordingStateMachine::onDelivery(Delivery&& delivery) {
    if (session_ && session_->id() == delivery.sessionId)
        session_->route(delivery.source, std::move(delivery.buffer));
}

void RecordingStateMachine::removeTemporaryFile(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        // Logged only, never surfaced
        LOG_WARN("Cleanup error ({}): could not remove {}: {}",
                 toString(RecorderError::Kind::Cleanup),
                 path.string(),
                 ec.message());
    }
}

void RecordingStateMachine::setState(RecorderState state) {
    auto previous = state_.exchange(state);
    if (previous == state)
        return;
    LOG_INFO("Recorder state: {} -> {}", toString(previous), toString(state));
    stateChanged.emitSignal(state);
}

void RecordingStateMachine::raise(RecorderError::Kind kind, std::string message) {
    RecorderError error{kind, std::move(message)};
    if (error.isWarning())
        LOG_WARN("{}: {}", toString(kind), error.message);
    else
        LOG_ERROR("{}: {}", toString(kind), error.message);
    {
        std::lock_guard lock(observableMutex_);
        lastError_ = error;
    }
    errorRaised.emitSignal(error);
}

void RecordingStateMachine::clearError() {
    std::lock_guard lock(observableMutex_);
    lastError_.reset();
}

} // namespace mc
