#pragma once

#include "audio/audio_chunker.h"
#include "core/config_loader.h"

#include <functional>
#include <memory>
#include <string>

namespace rtsub {
namespace audio {

// Invoked from the capture consumer thread with one 8000-sample 16 kHz chunk
using ChunkCallback = std::function<void(const AudioChunk&)>;

/**
 * @brief One capture stream delivering 16 kHz mono chunks
 *
 * start() throws DeviceError when the device cannot be opened or when the
 * source is already running. stop() is idempotent and safe without start().
 */
class AudioSource {
   public:
    virtual ~AudioSource() = default;

    virtual void start(ChunkCallback callback) = 0;
    virtual void stop() = 0;
    virtual bool isRunning() const = 0;

    virtual SourceKind kind() const = 0;
    virtual std::string deviceName() const = 0;
};

std::unique_ptr<AudioSource> createAudioSource(SourceKind kind, const WorkerConfig& config);

}  // namespace audio
}  // namespace rtsub
