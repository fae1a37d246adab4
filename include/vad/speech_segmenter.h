#pragma once

#include "audio/audio_chunker.h"
#include "core/subtitle_constants.h"
#include "vad/speech_model.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace rtsub {
namespace vad {

using SpeechSegment = std::vector<float>;

struct SegmenterConfig {
    float threshold = SubtitleConstants::VAD_THRESHOLD;
    int silenceFrames = SubtitleConstants::VAD_SILENCE_FRAMES;
    int maxBufferFrames = SubtitleConstants::VAD_MAX_BUFFER_FRAMES;
};

/**
 * @brief Groups 16 kHz audio into speech segments
 *
 * Chunks are cut into model-sized frames (leftover carried to the next
 * chunk). Speech frames extend the buffer; silence frames extend a non-empty
 * buffer and count towards the silence limit. A segment is emitted when the
 * silence run reaches silenceFrames or the buffer reaches maxBufferFrames.
 * The recurrent state survives flushes.
 */
class SpeechSegmenter {
   public:
    SpeechSegmenter(std::shared_ptr<SpeechProbabilityModel> model, SegmenterConfig config = {});

    // Throws InferenceError when the model fails on a frame
    std::vector<SpeechSegment> process(const audio::AudioChunk& chunk);

    bool isAccumulating() const {
        return !buffer_.empty();
    }
    std::size_t bufferedSamples() const {
        return buffer_.size();
    }
    std::size_t leftoverSamples() const {
        return leftover_.size();
    }
    int silenceCount() const {
        return silenceCount_;
    }
    const RecurrentState& state() const {
        return state_;
    }
    uint64_t framesProcessed() const {
        return framesProcessed_;
    }

   private:
    void handleFrame(const float* frame, std::vector<SpeechSegment>& out);
    void flush(std::vector<SpeechSegment>& out);

    std::shared_ptr<SpeechProbabilityModel> model_;
    SegmenterConfig config_;
    std::size_t frameSamples_;
    std::size_t maxBufferSamples_;

    RecurrentState state_;
    std::vector<float> leftover_;
    std::vector<float> buffer_;
    int silenceCount_ = 0;
    uint64_t framesProcessed_ = 0;
};

}  // namespace vad
}  // namespace rtsub
