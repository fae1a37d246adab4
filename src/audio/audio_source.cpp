#include "audio/audio_source.h"

#include "audio/microphone_audio_source.h"
#include "audio/monitor_audio_source.h"
#include "core/subtitle_constants.h"

namespace rtsub {
namespace audio {

std::unique_ptr<AudioSource> createAudioSource(SourceKind kind, const WorkerConfig& config) {
    switch (kind) {
    case SourceKind::Mic:
        return std::make_unique<MicrophoneAudioSource>(config.micDevice, config.micSampleRate);
    case SourceKind::Monitor:
    default:
        return std::make_unique<MonitorAudioSource>(
            config.monitorDevice, SubtitleConstants::DEFAULT_MONITOR_SAMPLE_RATE);
    }
}

}  // namespace audio
}  // namespace rtsub
