#include "SampleBuffer.hpp"

namespace mc {

SampleBuffer::SampleBuffer(AudioFormat format,
                           std::vector<i16> samples,
                           Seconds pts)
    : format_(format), samples_(std::move(samples)), pts_(pts) {
    if (format_.channels > 0) {
        frameCount_ = samples_.size() / format_.channels;
        samples_.resize(frameCount_ * format_.channels);
    } else {
        samples_.clear();
    }
}

} // namespace mc
