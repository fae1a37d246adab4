#include "audio/polyphase_resampler.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace rtsub {
namespace audio {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr std::size_t kBaseTapsPerPhase = 16;
constexpr double kCutoffMargin = 0.9;  // keep the transition band below Nyquist

double sinc(double x) {
    if (std::fabs(x) < 1e-12) {
        return 1.0;
    }
    return std::sin(kPi * x) / (kPi * x);
}

}  // namespace

PolyphaseResampler::PolyphaseResampler(int inputRate, int outputRate)
    : inputRate_(inputRate), outputRate_(outputRate) {
    if (inputRate <= 0 || outputRate <= 0) {
        throw std::invalid_argument("PolyphaseResampler: sample rates must be positive");
    }
    bypass_ = (inputRate == outputRate);
    if (bypass_) {
        return;
    }

    const int g = std::gcd(inputRate, outputRate);
    upFactor_ = static_cast<std::size_t>(outputRate / g);
    downFactor_ = static_cast<std::size_t>(inputRate / g);

    // Wider filters when decimating so the narrower pass band keeps enough zero crossings
    double ratio = std::max(1.0, static_cast<double>(downFactor_) / upFactor_);
    tapsPerPhase_ = static_cast<std::size_t>(std::ceil(kBaseTapsPerPhase * ratio));

    designFilter();
    reset();
}

void PolyphaseResampler::designFilter() {
    const std::size_t L = upFactor_;
    const std::size_t length = L * tapsPerPhase_;
    // Cutoff in cycles per upsampled sample
    const double fc = 0.5 / static_cast<double>(std::max(L, downFactor_)) * kCutoffMargin;
    const double center = (static_cast<double>(length) - 1.0) / 2.0;

    std::vector<double> h(length);
    for (std::size_t i = 0; i < length; ++i) {
        double t = static_cast<double>(i) - center;
        double window = 0.42 - 0.5 * std::cos(2.0 * kPi * i / (length - 1)) +
                        0.08 * std::cos(4.0 * kPi * i / (length - 1));  // Blackman
        h[i] = 2.0 * fc * sinc(2.0 * fc * t) * window;
    }

    // Normalize DC gain to L (zero stuffing divides energy by L)
    double sum = std::accumulate(h.begin(), h.end(), 0.0);
    double scale = (sum != 0.0) ? static_cast<double>(L) / sum : 1.0;

    phases_.assign(L, std::vector<float>(tapsPerPhase_, 0.0f));
    for (std::size_t p = 0; p < L; ++p) {
        for (std::size_t k = 0; k < tapsPerPhase_; ++k) {
            phases_[p][k] = static_cast<float>(h[p + k * L] * scale);
        }
    }
}

void PolyphaseResampler::reset() {
    history_.assign(tapsPerPhase_ > 0 ? tapsPerPhase_ - 1 : 0, 0.0f);
    phase_ = 0;
    inputIndex_ = 0;
}

void PolyphaseResampler::process(const float* input, std::size_t count, std::vector<float>& out) {
    if (count == 0 || !input) {
        return;
    }
    if (bypass_) {
        out.insert(out.end(), input, input + count);
        return;
    }

    const std::size_t historyLen = history_.size();
    work_.resize(historyLen + count);
    std::copy(history_.begin(), history_.end(), work_.begin());
    std::copy(input, input + count, work_.begin() + static_cast<std::ptrdiff_t>(historyLen));

    out.reserve(out.size() + (count * upFactor_) / downFactor_ + 1);

    while (inputIndex_ < count) {
        const std::vector<float>& taps = phases_[phase_];
        // work_[inputIndex_ + historyLen] is the newest sample under the filter
        const float* newest = work_.data() + inputIndex_ + historyLen;
        float acc = 0.0f;
        for (std::size_t k = 0; k < tapsPerPhase_; ++k) {
            acc += taps[k] * *(newest - k);
        }
        out.push_back(acc);

        phase_ += downFactor_;
        inputIndex_ += phase_ / upFactor_;
        phase_ %= upFactor_;
    }
    inputIndex_ -= count;

    std::copy(work_.end() - static_cast<std::ptrdiff_t>(historyLen), work_.end(), history_.begin());
}

}  // namespace audio
}  // namespace rtsub
