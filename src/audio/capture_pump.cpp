#include "audio/capture_pump.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <chrono>

namespace rtsub {
namespace audio {

namespace {
constexpr std::size_t kReadBlockSamples = 4096;
constexpr auto kIdleWait = std::chrono::milliseconds(10);
}  // namespace

CapturePump::CapturePump(std::string tag, std::size_t ringCapacity)
    : tag_(std::move(tag)), ring_(ringCapacity) {
    readBuffer_.resize(kReadBlockSamples);
}

CapturePump::~CapturePump() {
    stop();
}

void CapturePump::start(int nativeRate, ChunkCallback callback) {
    if (running_.load(std::memory_order_acquire)) {
        throw DeviceError(tag_ + " capture already running");
    }
    callback_ = std::move(callback);
    ring_.reset();
    chunker_.clear();
    lastDropped_ = 0;
    nativeRate_.store(nativeRate > 0 ? nativeRate : SubtitleConstants::TARGET_SAMPLE_RATE,
                      std::memory_order_release);
    resampler_ = std::make_unique<PolyphaseResampler>(nativeRate_.load(),
                                                      SubtitleConstants::TARGET_SAMPLE_RATE);

    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&CapturePump::consumerLoop, this);
}

void CapturePump::stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void CapturePump::consumerLoop() {
    LOG_DEBUG("[{}] Capture consumer started ({} Hz -> {} Hz)", tag_, resampler_->inputRate(),
              SubtitleConstants::TARGET_SAMPLE_RATE);

    while (running_.load(std::memory_order_acquire)) {
        std::size_t n = ring_.pop(readBuffer_.data(), readBuffer_.size());
        if (n == 0) {
            std::this_thread::sleep_for(kIdleWait);
            continue;
        }
        try {
            processBlock(readBuffer_.data(), n);
        } catch (const std::exception& e) {
            callbackErrors_.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("[{}] Capture consumer error: {}", tag_, e.what());
        }

        uint64_t dropped = ring_.droppedSamples();
        if (dropped != lastDropped_) {
            LOG_EVERY_N(WARN, 50, "[{}] Capture ring overflow, {} samples dropped so far", tag_,
                        dropped);
            lastDropped_ = dropped;
        }
    }

    LOG_DEBUG("[{}] Capture consumer stopped ({} chunks)", tag_, chunksDelivered());
}

void CapturePump::processBlock(const float* samples, std::size_t count) {
    int rate = nativeRate_.load(std::memory_order_acquire);
    if (rate != resampler_->inputRate()) {
        LOG_INFO("[{}] Native rate changed: {} -> {} Hz", tag_, resampler_->inputRate(), rate);
        resampler_ =
            std::make_unique<PolyphaseResampler>(rate, SubtitleConstants::TARGET_SAMPLE_RATE);
    }

    resampled_.clear();
    resampler_->process(samples, count, resampled_);

    for (auto& chunk : chunker_.append(resampled_.data(), resampled_.size())) {
        chunksDelivered_.fetch_add(1, std::memory_order_relaxed);
        if (!callback_) {
            continue;
        }
        try {
            callback_(chunk);
        } catch (const std::exception& e) {
            callbackErrors_.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("[{}] Chunk callback failed: {}", tag_, e.what());
        }
    }
}

}  // namespace audio
}  // namespace rtsub
