/**
 * @file CaptureSource.hpp
 * @brief Interface for an asynchronously delivering audio producer.
 *
 * A capture source owns its own delivery thread. Buffers arrive in
 * increasing timestamp order within one source; no ordering holds across
 * sources. Callbacks run on the source's thread and must not block.
 *
 * @section Patterns
 * - Strategy: PulseAudio in production, scripted fakes in tests.
 */

#pragma once
#include <functional>
#include <memory>
#include <string>
#include "audio/SampleBuffer.hpp"
#include "util/Result.hpp"

namespace mc {

enum class SourceKind { System, Microphone };

inline const char* toString(SourceKind kind) {
    return kind == SourceKind::System ? "system" : "microphone";
}

class CaptureSource {
public:
    using BufferCallback = std::function<void(SampleBuffer&&)>;
    using FailureCallback = std::function<void(const std::string&)>;

    virtual ~CaptureSource() = default;

    // Acquires the device and starts delivering. Fails without invoking
    // either callback when the device cannot be opened.
    virtual Result<void> start(BufferCallback onBuffer,
                               FailureCallback onFailure) = 0;

    // Stops delivery. No callback fires after stop() returns.
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;
    virtual SourceKind kind() const = 0;
    virtual std::string name() const = 0;
};

using CaptureSourceFactory =
        std::function<std::unique_ptr<CaptureSource>(SourceKind)>;

} // namespace mc
