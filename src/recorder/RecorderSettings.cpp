#include "RecorderSettings.hpp"
#include "util/FileUtils.hpp"

namespace mc {

RecorderSettings RecorderSettings::fromConfig(const AudioConfig& audio,
                                              const RecordingConfig& recording) {
    RecorderSettings s;
    s.format.sampleRate = audio.sampleRate;
    s.format.channels = audio.channels;
    s.preBufferCapacity = Seconds(recording.preBufferSeconds);
    s.outputDirectory = recording.outputDirectory.empty()
                                ? file::documentsDir() / "meetcap"
                                : recording.outputDirectory;
    s.tempDirectory = recording.tempDirectory.empty() ? file::tempDir()
                                                      : recording.tempDirectory;
    s.deliveryQueueCapacity = recording.deliveryQueueCapacity;
    return s;
}

} // namespace mc
