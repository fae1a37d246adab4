#pragma once

#include "audio/audio_chunker.h"
#include "audio/audio_source.h"
#include "audio/capture_ring_buffer.h"
#include "audio/polyphase_resampler.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace rtsub {
namespace audio {

/**
 * @brief Consumer half shared by every AudioSource
 *
 * The device side only calls pushFromDevice(), which copies into a
 * lock-free ring and returns. A consumer thread drains the ring, resamples
 * to 16 kHz, slices 8000-sample chunks and hands them to the callback.
 * Exceptions from the callback are logged and the loop keeps running.
 */
class CapturePump {
   public:
    CapturePump(std::string tag, std::size_t ringCapacity);
    ~CapturePump();

    CapturePump(const CapturePump&) = delete;
    CapturePump& operator=(const CapturePump&) = delete;

    void start(int nativeRate, ChunkCallback callback);
    void stop();
    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    // Realtime-safe: no locks, no allocation
    std::size_t pushFromDevice(const float* samples, std::size_t count) {
        return ring_.push(samples, count);
    }

    // Picked up by the consumer thread before its next resample
    void setNativeRate(int rate) {
        if (rate > 0) {
            nativeRate_.store(rate, std::memory_order_release);
        }
    }
    int nativeRate() const {
        return nativeRate_.load(std::memory_order_acquire);
    }

    uint64_t chunksDelivered() const {
        return chunksDelivered_.load(std::memory_order_relaxed);
    }
    uint64_t callbackErrors() const {
        return callbackErrors_.load(std::memory_order_relaxed);
    }

   private:
    void consumerLoop();
    void processBlock(const float* samples, std::size_t count);

    std::string tag_;
    CaptureRingBuffer ring_;
    ChunkCallback callback_;
    std::unique_ptr<PolyphaseResampler> resampler_;
    AudioChunker chunker_;
    std::vector<float> readBuffer_;
    std::vector<float> resampled_;

    std::atomic<bool> running_{false};
    std::atomic<int> nativeRate_{SubtitleConstants::TARGET_SAMPLE_RATE};
    std::atomic<uint64_t> chunksDelivered_{0};
    std::atomic<uint64_t> callbackErrors_{0};
    uint64_t lastDropped_ = 0;
    std::thread thread_;
};

}  // namespace audio
}  // namespace rtsub
