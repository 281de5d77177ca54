#include "PreBufferRing.hpp"
#include <iterator>

namespace mc {

PreBufferRing::PreBufferRing(Seconds capacity) : capacity_(capacity) {}

void PreBufferRing::push(SampleBuffer buffer) {
    if (buffers_.empty())
        format_ = buffer.format();

    frames_ += buffer.frameCount();
    buffers_.push_back(std::move(buffer));

    const u64 ceiling = format_.secondsToFrames(capacity_.count());
    while (frames_ > ceiling && buffers_.size() > 1) {
        frames_ -= buffers_.front().frameCount();
        buffers_.pop_front();
        ++evicted_;
    }
}

std::vector<SampleBuffer> PreBufferRing::drainAll() {
    std::vector<SampleBuffer> out;
    out.reserve(buffers_.size());
    std::move(buffers_.begin(), buffers_.end(), std::back_inserter(out));
    buffers_.clear();
    frames_ = 0;
    return out;
}

void PreBufferRing::discard() {
    buffers_.clear();
    frames_ = 0;
}

} // namespace mc
