#pragma once

#include "audio/audio_source.h"
#include "audio/capture_pump.h"

#include <atomic>
#include <string>

struct pw_thread_loop;
struct pw_stream;

namespace rtsub {
namespace audio {

/**
 * @brief Loopback capture of a PipeWire sink monitor
 *
 * An empty device name captures the default sink's monitor; otherwise the
 * named node is targeted. Requests mono float32 and lets PipeWire mix down.
 */
class MonitorAudioSource : public AudioSource {
   public:
    MonitorAudioSource(std::string device, int preferredRate);
    ~MonitorAudioSource() override;

    void start(ChunkCallback callback) override;
    void stop() override;
    bool isRunning() const override {
        return running_.load(std::memory_order_acquire);
    }

    SourceKind kind() const override {
        return SourceKind::Monitor;
    }
    std::string deviceName() const override {
        return device_.empty() ? std::string("default-sink.monitor") : device_;
    }

   private:
    friend struct MonitorStreamCallbacks;

    void releaseStream();

    std::string device_;
    int preferredRate_;
    CapturePump pump_;
    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;
    std::atomic<bool> running_{false};
    std::atomic<int> streamState_{0};
    std::string streamError_;
};

}  // namespace audio
}  // namespace rtsub
