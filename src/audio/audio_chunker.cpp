#include "audio/audio_chunker.h"

#include <stdexcept>

namespace rtsub {
namespace audio {

AudioChunker::AudioChunker(std::size_t chunkSamples) : chunkSamples_(chunkSamples) {
    if (chunkSamples_ == 0) {
        throw std::invalid_argument("AudioChunker: chunk size must be > 0");
    }
    pending_.reserve(chunkSamples_ * 2);
}

std::vector<AudioChunk> AudioChunker::append(const float* samples, std::size_t count) {
    std::vector<AudioChunk> chunks;
    if (count == 0 || !samples) {
        return chunks;
    }
    pending_.insert(pending_.end(), samples, samples + count);

    std::size_t offset = 0;
    while (pending_.size() - offset >= chunkSamples_) {
        auto begin = pending_.begin() + static_cast<std::ptrdiff_t>(offset);
        chunks.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(chunkSamples_));
        offset += chunkSamples_;
    }
    if (offset > 0) {
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
    return chunks;
}

}  // namespace audio
}  // namespace rtsub
