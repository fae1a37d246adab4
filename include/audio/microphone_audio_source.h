#pragma once

#include "audio/audio_source.h"
#include "audio/capture_pump.h"

#include <alsa/asoundlib.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace rtsub {
namespace audio {

// Converts interleaved FLOAT_LE / S16_LE frames to mono float (channel average)
bool convertCaptureToMono(const void* src, snd_pcm_format_t format, size_t frames,
                          unsigned int channels, std::vector<float>& dst);

/**
 * @brief Microphone capture through an ALSA PCM
 *
 * The PCM is opened inside start() so open failures surface as DeviceError.
 * A reader thread pulls periods with snd_pcm_readi and pushes them into the
 * capture pump; xruns are recovered in place.
 */
class MicrophoneAudioSource : public AudioSource {
   public:
    MicrophoneAudioSource(std::string device, int preferredRate);
    ~MicrophoneAudioSource() override;

    void start(ChunkCallback callback) override;
    void stop() override;
    bool isRunning() const override {
        return running_.load(std::memory_order_acquire);
    }

    SourceKind kind() const override {
        return SourceKind::Mic;
    }
    std::string deviceName() const override {
        return device_;
    }

   private:
    void openDevice();
    void readerLoop();

    std::string device_;
    int preferredRate_;
    CapturePump pump_;
    snd_pcm_t* handle_ = nullptr;
    snd_pcm_format_t format_ = SND_PCM_FORMAT_FLOAT_LE;
    unsigned int channels_ = 1;
    unsigned int rate_ = 0;
    snd_pcm_uframes_t periodFrames_ = 1024;
    std::atomic<bool> running_{false};
    std::thread reader_;
};

}  // namespace audio
}  // namespace rtsub
