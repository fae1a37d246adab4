#include "audio/microphone_audio_source.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <chrono>
#include <cstdint>

namespace rtsub {
namespace audio {

bool convertCaptureToMono(const void* src, snd_pcm_format_t format, size_t frames,
                          unsigned int channels, std::vector<float>& dst) {
    if (channels == 0) {
        return false;
    }
    dst.resize(frames);
    const float channelScale = 1.0f / static_cast<float>(channels);

    if (format == SND_PCM_FORMAT_FLOAT_LE) {
        const auto* in = static_cast<const float*>(src);
        for (size_t f = 0; f < frames; ++f) {
            float sum = 0.0f;
            for (unsigned int c = 0; c < channels; ++c) {
                sum += in[f * channels + c];
            }
            dst[f] = sum * channelScale;
        }
        return true;
    }

    if (format == SND_PCM_FORMAT_S16_LE) {
        const auto* in = static_cast<const int16_t*>(src);
        constexpr float scale = 1.0f / 32768.0f;
        for (size_t f = 0; f < frames; ++f) {
            float sum = 0.0f;
            for (unsigned int c = 0; c < channels; ++c) {
                sum += static_cast<float>(in[f * channels + c]) * scale;
            }
            dst[f] = sum * channelScale;
        }
        return true;
    }

    return false;
}

MicrophoneAudioSource::MicrophoneAudioSource(std::string device, int preferredRate)
    : device_(device.empty() ? std::string("default") : std::move(device)),
      preferredRate_(preferredRate),
      pump_("Mic", SubtitleConstants::CAPTURE_RING_CAPACITY) {}

MicrophoneAudioSource::~MicrophoneAudioSource() {
    stop();
}

void MicrophoneAudioSource::openDevice() {
    snd_pcm_t* handle = nullptr;
    int err = snd_pcm_open(&handle, device_.c_str(), SND_PCM_STREAM_CAPTURE, SND_PCM_NONBLOCK);
    if (err < 0) {
        throw DeviceError("cannot open capture device " + device_ + ": " + snd_strerror(err));
    }

    auto fail = [&](const std::string& what) {
        snd_pcm_close(handle);
        throw DeviceError("[" + device_ + "] " + what + ": " + snd_strerror(err));
    };

    snd_pcm_hw_params_t* hw_params;
    snd_pcm_hw_params_alloca(&hw_params);
    snd_pcm_hw_params_any(handle, hw_params);

    if ((err = snd_pcm_hw_params_set_access(handle, hw_params, SND_PCM_ACCESS_RW_INTERLEAVED)) <
        0) {
        fail("cannot set access");
    }

    format_ = SND_PCM_FORMAT_FLOAT_LE;
    if (snd_pcm_hw_params_set_format(handle, hw_params, format_) < 0) {
        format_ = SND_PCM_FORMAT_S16_LE;
        if ((err = snd_pcm_hw_params_set_format(handle, hw_params, format_)) < 0) {
            fail("neither FLOAT_LE nor S16_LE supported");
        }
    }

    channels_ = 1;
    if ((err = snd_pcm_hw_params_set_channels_near(handle, hw_params, &channels_)) < 0) {
        fail("cannot set channels");
    }

    rate_ = static_cast<unsigned int>(preferredRate_);
    if ((err = snd_pcm_hw_params_set_rate_near(handle, hw_params, &rate_, nullptr)) < 0) {
        fail("cannot set rate");
    }

    periodFrames_ = rate_ / 50;  // 20 ms
    if ((err = snd_pcm_hw_params_set_period_size_near(handle, hw_params, &periodFrames_,
                                                      nullptr)) < 0) {
        fail("cannot set period size");
    }
    snd_pcm_uframes_t buffer_frames = periodFrames_ * 8;
    if ((err = snd_pcm_hw_params_set_buffer_size_near(handle, hw_params, &buffer_frames)) < 0) {
        fail("cannot set buffer size");
    }

    if ((err = snd_pcm_hw_params(handle, hw_params)) < 0) {
        fail("cannot apply hardware parameters");
    }
    snd_pcm_hw_params_get_period_size(hw_params, &periodFrames_, nullptr);

    if ((err = snd_pcm_prepare(handle)) < 0) {
        fail("cannot prepare capture device");
    }
    if ((err = snd_pcm_start(handle)) < 0) {
        fail("cannot start capture device");
    }

    handle_ = handle;
    LOG_INFO("[Mic] Capture device {} configured ({} Hz, {} ch, {}, period {} frames)", device_,
             rate_, channels_, snd_pcm_format_name(format_), periodFrames_);
}

void MicrophoneAudioSource::start(ChunkCallback callback) {
    if (running_.load(std::memory_order_acquire)) {
        throw DeviceError("microphone capture already running");
    }
    openDevice();

    try {
        pump_.start(static_cast<int>(rate_), std::move(callback));
    } catch (...) {
        snd_pcm_close(handle_);
        handle_ = nullptr;
        throw;
    }
    running_.store(true, std::memory_order_release);
    reader_ = std::thread(&MicrophoneAudioSource::readerLoop, this);
}

void MicrophoneAudioSource::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    pump_.stop();
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
    LOG_INFO("[Mic] Capture stopped");
}

void MicrophoneAudioSource::readerLoop() {
    const size_t bytesPerSample = (format_ == SND_PCM_FORMAT_FLOAT_LE) ? 4 : 2;
    std::vector<uint8_t> raw(static_cast<size_t>(periodFrames_) * channels_ * bytesPerSample);
    std::vector<float> mono;

    while (running_.load(std::memory_order_acquire)) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle_, raw.data(), periodFrames_);
        if (frames == -EAGAIN || frames == 0) {
            if (snd_pcm_wait(handle_, 100) < 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            continue;
        }
        if (frames == -EPIPE) {
            LOG_EVERY_N(WARN, 20, "[Mic] Overrun detected, recovering");
            snd_pcm_prepare(handle_);
            snd_pcm_start(handle_);
            continue;
        }
        if (frames < 0) {
            LOG_WARN("[Mic] Read error: {}", snd_strerror(static_cast<int>(frames)));
            if (snd_pcm_recover(handle_, static_cast<int>(frames), 1) < 0) {
                LOG_ERROR("[Mic] Recover failed, retrying");
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }

        if (!convertCaptureToMono(raw.data(), format_, static_cast<size_t>(frames), channels_,
                                  mono)) {
            LOG_ERROR("[Mic] Unsupported sample format {}", snd_pcm_format_name(format_));
            break;
        }
        pump_.pushFromDevice(mono.data(), mono.size());
    }
    LOG_DEBUG("[Mic] Reader thread terminated");
}

}  // namespace audio
}  // namespace rtsub
