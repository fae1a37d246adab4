#pragma once

#include <cstddef>
#include <vector>

namespace rtsub {
namespace audio {

/**
 * @brief Streaming rational-ratio resampler (mono, float32)
 *
 * Upsample by L, windowed-sinc low-pass, decimate by M, evaluated in
 * polyphase form so only the taps of the active phase are computed.
 * L/M = outputRate/inputRate reduced by their gcd.
 *
 * Filter history and the fractional phase are carried across process()
 * calls, so feeding a signal in arbitrary block sizes yields the same
 * output as feeding it at once. Equal rates bypass filtering.
 */
class PolyphaseResampler {
   public:
    PolyphaseResampler(int inputRate, int outputRate);

    int inputRate() const {
        return inputRate_;
    }
    int outputRate() const {
        return outputRate_;
    }
    bool isBypass() const {
        return bypass_;
    }
    std::size_t tapsPerPhase() const {
        return tapsPerPhase_;
    }

    // Appends resampled output to out
    void process(const float* input, std::size_t count, std::vector<float>& out);

    // Clears filter history and phase
    void reset();

   private:
    void designFilter();

    int inputRate_;
    int outputRate_;
    std::size_t upFactor_ = 1;    // L
    std::size_t downFactor_ = 1;  // M
    std::size_t tapsPerPhase_ = 0;
    bool bypass_ = false;

    // phases_[p][k] = h[p + k * L]
    std::vector<std::vector<float>> phases_;

    std::vector<float> history_;  // last tapsPerPhase_-1 input samples
    std::vector<float> work_;
    std::size_t phase_ = 0;      // position within L
    std::size_t inputIndex_ = 0;  // newest input sample used by the next output
};

}  // namespace audio
}  // namespace rtsub
