/**
 * @file PreBufferRing.hpp
 * @brief Bounded-duration FIFO of captured audio.
 *
 * Holds the most recent `capacity` seconds of one capture stream while the
 * user has not yet decided to keep the recording. Oldest buffers are evicted
 * once the running duration exceeds the ceiling, except that the ring never
 * evicts its last element: a single buffer longer than the ceiling is kept.
 *
 * Durations are kept as frame counts at the format of the first buffer
 * pushed, so long runs of short buffers do not drift. All buffers in one
 * ring share a format.
 *
 * Not thread-safe. The owner serializes push/drain/discard.
 */

#pragma once
#include <deque>
#include <vector>
#include "audio/SampleBuffer.hpp"

namespace mc {

class PreBufferRing {
public:
    explicit PreBufferRing(Seconds capacity = Seconds(30.0));

    void push(SampleBuffer buffer);

    // Removes and returns all buffers in insertion order
    std::vector<SampleBuffer> drainAll();

    // Drops all buffers without returning them
    void discard();

    Seconds capacity() const {
        return capacity_;
    }
    Seconds duration() const {
        return Seconds(format_.framesToSeconds(frames_));
    }
    u64 frames() const {
        return frames_;
    }
    usize size() const {
        return buffers_.size();
    }
    bool empty() const {
        return buffers_.empty();
    }
    u64 evictedCount() const {
        return evicted_;
    }

    // Oldest / newest retained buffer. Undefined when empty.
    const SampleBuffer& front() const {
        return buffers_.front();
    }
    const SampleBuffer& back() const {
        return buffers_.back();
    }

private:
    Seconds capacity_;
    std::deque<SampleBuffer> buffers_;
    AudioFormat format_;
    u64 frames_{0};
    u64 evicted_{0};
};

} // namespace mc
