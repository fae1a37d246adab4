#include "vad/speech_segmenter.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <stdexcept>

namespace rtsub {
namespace vad {

SpeechSegmenter::SpeechSegmenter(std::shared_ptr<SpeechProbabilityModel> model,
                                 SegmenterConfig config)
    : model_(std::move(model)), config_(config) {
    if (!model_) {
        throw std::invalid_argument("SpeechSegmenter requires a model");
    }
    frameSamples_ = model_->frameSamples();
    if (frameSamples_ == 0) {
        throw std::invalid_argument("SpeechSegmenter: model frame size must be > 0");
    }
    maxBufferSamples_ = frameSamples_ * static_cast<std::size_t>(config_.maxBufferFrames);
    buffer_.reserve(maxBufferSamples_);
}

std::vector<SpeechSegment> SpeechSegmenter::process(const audio::AudioChunk& chunk) {
    std::vector<SpeechSegment> segments;
    leftover_.insert(leftover_.end(), chunk.begin(), chunk.end());

    std::size_t offset = 0;
    while (leftover_.size() - offset >= frameSamples_) {
        handleFrame(leftover_.data() + offset, segments);
        offset += frameSamples_;
    }
    leftover_.erase(leftover_.begin(), leftover_.begin() + static_cast<std::ptrdiff_t>(offset));
    return segments;
}

void SpeechSegmenter::handleFrame(const float* frame, std::vector<SpeechSegment>& out) {
    float probability = 0.0f;
    InferenceResult result = model_->infer(frame, state_, probability);
    if (!result.ok()) {
        throw InferenceError(std::string("speech model ") + model_->name() + " failed (" +
                             inferenceStatusToString(result.status) + "): " + result.message);
    }
    ++framesProcessed_;

    if (probability >= config_.threshold) {
        buffer_.insert(buffer_.end(), frame, frame + frameSamples_);
        silenceCount_ = 0;
    } else if (!buffer_.empty()) {
        // Trailing silence stays in the segment
        buffer_.insert(buffer_.end(), frame, frame + frameSamples_);
        ++silenceCount_;
        if (silenceCount_ >= config_.silenceFrames) {
            flush(out);
            return;
        }
    }

    if (buffer_.size() >= maxBufferSamples_) {
        LOG_DEBUG("[VAD] Max buffer reached, forcing flush");
        flush(out);
    }
}

void SpeechSegmenter::flush(std::vector<SpeechSegment>& out) {
    LOG_DEBUG("[VAD] Segment ready: {:.2f}s",
              static_cast<double>(buffer_.size()) / SubtitleConstants::TARGET_SAMPLE_RATE);
    out.emplace_back(std::move(buffer_));
    buffer_ = std::vector<float>();
    buffer_.reserve(maxBufferSamples_);
    silenceCount_ = 0;
}

}  // namespace vad
}  // namespace rtsub
