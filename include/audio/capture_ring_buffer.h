#ifndef RTSUB_CAPTURE_RING_BUFFER_H
#define RTSUB_CAPTURE_RING_BUFFER_H

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace rtsub {
namespace audio {

// Lock-free SPSC sample queue between a device callback and the capture consumer.
//
// The producer (PipeWire process callback / ALSA reader) calls push() and never
// blocks: samples that do not fit are dropped and counted. The consumer thread
// drains with pop().
//
// Memory ordering:
//   - producer is the sole writer of tail_, consumer the sole writer of head_
//   - size_ is the synchronization point (release on update, acquire on load)
//   - reset() must only run while neither side is active

class CaptureRingBuffer {
   public:
    explicit CaptureRingBuffer(size_t capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("CaptureRingBuffer capacity must be > 0");
        }
        buffer_.assign(capacity, 0.0f);
    }

    size_t capacity() const {
        return buffer_.size();
    }

    size_t available() const {
        return size_.load(std::memory_order_acquire);
    }

    uint64_t droppedSamples() const {
        return dropped_.load(std::memory_order_relaxed);
    }

    // Producer side. Returns the number of samples stored.
    size_t push(const float* data, size_t count) {
        size_t cap = capacity();
        size_t room = cap - size_.load(std::memory_order_acquire);
        size_t n = std::min(count, room);
        if (n < count) {
            dropped_.fetch_add(count - n, std::memory_order_relaxed);
        }
        if (n == 0) {
            return 0;
        }
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t first = std::min(n, cap - tail);
        std::memcpy(buffer_.data() + tail, data, first * sizeof(float));
        if (n > first) {
            std::memcpy(buffer_.data(), data + first, (n - first) * sizeof(float));
        }
        tail_.store((tail + n) % cap, std::memory_order_relaxed);
        size_.fetch_add(n, std::memory_order_release);
        return n;
    }

    // Consumer side. Reads up to maxCount samples, returns how many were read.
    size_t pop(float* dst, size_t maxCount) {
        size_t cap = capacity();
        size_t n = std::min(maxCount, size_.load(std::memory_order_acquire));
        if (n == 0) {
            return 0;
        }
        size_t head = head_.load(std::memory_order_relaxed);
        size_t first = std::min(n, cap - head);
        std::memcpy(dst, buffer_.data() + head, first * sizeof(float));
        if (n > first) {
            std::memcpy(dst + first, buffer_.data(), (n - first) * sizeof(float));
        }
        head_.store((head + n) % cap, std::memory_order_relaxed);
        size_.fetch_sub(n, std::memory_order_release);
        return n;
    }

    void reset() {
        head_.store(0, std::memory_order_relaxed);
        tail_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
        size_.store(0, std::memory_order_release);
    }

   private:
    std::vector<float> buffer_;
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
    std::atomic<size_t> size_{0};
    std::atomic<uint64_t> dropped_{0};
};

}  // namespace audio
}  // namespace rtsub

#endif  // RTSUB_CAPTURE_RING_BUFFER_H
