#pragma once

#include "core/subtitle_constants.h"

#include <cstddef>
#include <vector>

namespace rtsub {
namespace audio {

// 16 kHz mono float32 block handed from capture to segmentation
using AudioChunk = std::vector<float>;

/**
 * @brief Slices a continuous sample stream into fixed-size chunks
 *
 * Samples short of a full chunk stay pending until the next append().
 */
class AudioChunker {
   public:
    explicit AudioChunker(std::size_t chunkSamples = SubtitleConstants::CHUNK_SAMPLES);

    std::vector<AudioChunk> append(const float* samples, std::size_t count);

    std::size_t chunkSamples() const {
        return chunkSamples_;
    }
    std::size_t pending() const {
        return pending_.size();
    }
    void clear() {
        pending_.clear();
    }

   private:
    std::size_t chunkSamples_;
    std::vector<float> pending_;
};

}  // namespace audio
}  // namespace rtsub
