/**
 * @file RecordingStateMachine.hpp
 * @brief Controller for meeting capture: pre-buffer, record, finalize.
 *
 * States: Idle, PreBuffering, Recording, Finalizing, Failed. Every public
 * operation is a transition executed on the coordinator thread; callers
 * block until the transition (including device acquisition or release and
 * the final mix) has completed. At most one CaptureSession exists at a time.
 *
 * Errors never escape as exceptions. Each failure is recorded in lastError()
 * and announced through errorRaised; operations that could not be performed
 * also return an error Result.
 *
 * @section Patterns
 * - State Machine: explicit transitions guarded by the current state.
 * - Facade: hides capture sources, rings, sinks and the mixer.
 */

#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "capture/CaptureSession.hpp"
#include "library/MixedRecording.hpp"
#include "recorder/Coordinator.hpp"
#include "recorder/RecorderSettings.hpp"
#include "util/Result.hpp"
#include "util/Signal.hpp"

namespace mc {

enum class RecorderState { Idle, PreBuffering, Recording, Finalizing, Failed };

const char* toString(RecorderState state);

struct RecorderError {
    enum class Kind {
        Acquisition, // device missing or denied; back to Idle, retryable
        Degraded,    // microphone unavailable; continuing system-only
        MidStream,   // a source died while capturing; partial data kept
        Mixing,      // mix failed; temporary files kept for recovery
        Cleanup      // temporary file removal failed; never surfaced
    };

    Kind kind;
    std::string message;

    bool isWarning() const {
        return kind == Kind::Degraded || kind == Kind::MidStream;
    }
};

const char* toString(RecorderError::Kind kind);

class RecordingStateMachine {
public:
    RecordingStateMachine(RecorderSettings settings,
                          CaptureSourceFactory sourceFactory);
    ~RecordingStateMachine();

    RecordingStateMachine(const RecordingStateMachine&) = delete;
    RecordingStateMachine& operator=(const RecordingStateMachine&) = delete;

    // Idle -> PreBuffering. Rejected unless Idle or Failed.
    Result<void> startPreBuffering(std::optional<std::string> meetingTitle = {});

    // PreBuffering -> Recording. From Idle it behaves like startRecording().
    Result<void> confirm();

    // PreBuffering -> Idle, discarding everything captured.
    Result<void> cancel();

    // Idle -> Recording. A no-op while already recording.
    Result<void> startRecording(std::optional<std::string> meetingTitle = {});

    // Recording -> Finalizing -> Idle. Ends in Idle even if mixing fails.
    Result<void> stopRecording();

    RecorderState state() const {
        return state_;
    }
    std::optional<RecorderError> lastError() const;
    std::optional<MixedRecording> lastRecording() const;
    const RecorderSettings& settings() const {
        return settings_;
    }

    // Audio held in the system pre-buffer ring right now
    Seconds preBufferedDuration();
    // Audio written to the system sink so far
    Seconds recordedDuration();
    bool microphoneActive();
    u64 droppedBuffers() const;

    Signal<RecorderState> stateChanged;
    Signal<const RecorderError&> errorRaised;
    Signal<const MixedRecording&> recordingFinished;

private:
    // All below run on the coordinator thread
    Result<void> doStartRecording(std::optional<std::string> meetingTitle);
    Result<void> openSession(Routing mode, std::optional<std::string> title);
    Result<void> finalizeSession();
    void onSourceFailure(u64 sessionId, SourceKind kind, const std::string& message);
    void onDelivery(Delivery&& delivery);
    void removeTemporaryFile(const fs::path& path);

    void setState(RecorderState state);
    void raise(RecorderError::Kind kind, std::string message);
    void clearError();

    RecorderSettings settings_;
    CaptureSourceFactory sourceFactory_;

    std::atomic<RecorderState> state_{RecorderState::Idle};
    std::unique_ptr<CaptureSession> session_;
    u64 nextSessionId_{1};

    mutable std::mutex observableMutex_;
    std::optional<RecorderError> lastError_;
    std::optional<MixedRecording> lastRecording_;

    // Declared last so its thread stops before the members above go away
    std::unique_ptr<Coordinator> coordinator_;
};

} // namespace mc
