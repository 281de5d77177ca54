#include "PulseAudioSource.hpp"
#include <pulse/error.h>
#include <pulse/simple.h>
#include <atomic>
#include <future>
#include <mutex>
#include <vector>
#include "core/Logger.hpp"

namespace mc {

// State shared with the capture thread. Outlives the source when the
// thread has to be abandoned on stop.
struct PulseAudioSource::Stream {
    ~Stream() {
        if (handle)
            pa_simple_free(handle);
    }

    pa_simple* handle{nullptr};
    SourceKind kind{SourceKind::System};
    AudioFormat format;
    u32 chunkFrames{0};

    BufferCallback onBuffer;
    FailureCallback onFailure;
    std::mutex callbackMutex;
    bool abandoned{false};

    std::atomic<bool> running{false};
    std::promise<void> finished;
};

PulseAudioSource::PulseAudioSource(SourceKind kind,
                                   std::string device,
                                   AudioFormat format,
                                   u32 chunkFrames,
                                   std::chrono::milliseconds stopTimeout)
    : kind_(kind),
      device_(std::move(device)),
      format_(format),
      chunkFrames_(chunkFrames),
      stopTimeout_(stopTimeout) {}

PulseAudioSource::~PulseAudioSource() {
    stop();
}

std::string PulseAudioSource::name() const {
    return std::string(toString(kind_)) + " (" +
           (device_.empty() ? std::string("default") : device_) + ")";
}

bool PulseAudioSource::isRunning() const {
    return stream_ && stream_->running;
}

Result<void> PulseAudioSource::start(BufferCallback onBuffer,
                                     FailureCallback onFailure) {
    if (isRunning()) {
        LOG_WARN("PulseAudioSource {}: already running", name());
        return Result<void>::ok();
    }

    pa_sample_spec ss;
    ss.format = PA_SAMPLE_S16LE;
    ss.rate = format_.sampleRate;
    ss.channels = static_cast<u8>(format_.channels);

    if (!pa_sample_spec_valid(&ss)) {
        return Result<void>::err("Unsupported capture format for " + name());
    }

    pa_buffer_attr ba;
    ba.maxlength = static_cast<u32>(-1);
    ba.tlength = static_cast<u32>(-1);
    ba.prebuf = static_cast<u32>(-1);
    ba.minreq = static_cast<u32>(-1);
    ba.fragsize = static_cast<u32>(pa_usec_to_bytes(20000, &ss));

    const char* device = device_.empty() ? nullptr : device_.c_str();
    const char* streamName =
            kind_ == SourceKind::System ? "System audio" : "Microphone";

    int error = 0;
    pa_simple* handle = pa_simple_new(nullptr,
                                      "meetcap",
                                      PA_STREAM_RECORD,
                                      device,
                                      streamName,
                                      &ss,
                                      nullptr,
                                      &ba,
                                      &error);
    if (!handle) {
        return Result<void>::err("Could not open " + name() + ": " +
                                 pa_strerror(error));
    }

    auto stream = std::make_shared<Stream>();
    stream->handle = handle;
    stream->kind = kind_;
    stream->format = format_;
    stream->chunkFrames = chunkFrames_;
    stream->onBuffer = std::move(onBuffer);
    stream->onFailure = std::move(onFailure);
    stream->running = true;
    stream_ = stream;

    thread_ = std::jthread([stream](std::stop_token st) {
        captureLoop(st, stream);
    });

    LOG_INFO("PulseAudioSource {}: capturing {} Hz, {} ch",
             name(),
             format_.sampleRate,
             format_.channels);
    return Result<void>::ok();
}

void PulseAudioSource::stop() {
    if (!thread_.joinable())
        return;

    auto finished = stream_->finished.get_future();
    thread_.request_stop();

    if (finished.wait_for(stopTimeout_) == std::future_status::ready) {
        thread_.join();
    } else {
        {
            std::lock_guard lock(stream_->callbackMutex);
            stream_->abandoned = true;
        }
        thread_.detach();
        LOG_ERROR("PulseAudioSource {}: capture thread did not stop within "
                  "{} ms, releasing it",
                  name(),
                  stopTimeout_.count());
    }

    stream_->running = false;
    stream_.reset();
    LOG_DEBUG("PulseAudioSource {}: stopped", name());
}

void PulseAudioSource::captureLoop(std::stop_token stopToken,
                                   std::shared_ptr<Stream> stream) {
    const usize channels = stream->format.channels;
    const usize frames = stream->chunkFrames;
    std::vector<i16> chunk(frames * channels);
    u64 framesDelivered = 0;

    LOG_DEBUG("Capture thread running ({})", toString(stream->kind));

    while (!stopToken.stop_requested()) {
        int error = 0;
        if (pa_simple_read(stream->handle,
                           chunk.data(),
                           chunk.size() * sizeof(i16),
                           &error) < 0) {
            std::lock_guard lock(stream->callbackMutex);
            if (!stopToken.stop_requested() && !stream->abandoned &&
                stream->onFailure) {
                stream->onFailure(std::string("Read error: ") +
                                  pa_strerror(error));
            }
            break;
        }

        Seconds pts(stream->format.framesToSeconds(framesDelivered));
        framesDelivered += frames;

        std::lock_guard lock(stream->callbackMutex);
        if (stopToken.stop_requested() || stream->abandoned)
            break;
        stream->onBuffer(SampleBuffer(stream->format, chunk, pts));
    }

    stream->running = false;
    LOG_DEBUG("Capture thread exiting ({})", toString(stream->kind));
    stream->finished.set_value();
}

CaptureSourceFactory pulseAudioSourceFactory(const AudioConfig& audio,
                                             std::chrono::milliseconds stopTimeout) {
    AudioFormat format{audio.sampleRate, audio.channels};
    return [audio, format, stopTimeout](SourceKind kind) {
        const auto& device = kind == SourceKind::System ? audio.systemDevice
                                                        : audio.microphoneDevice;
        return std::make_unique<PulseAudioSource>(
                kind, device, format, audio.chunkFrames, stopTimeout);
    };
}

} // namespace mc
