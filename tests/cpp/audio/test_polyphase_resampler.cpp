/**
 * @file test_polyphase_resampler.cpp
 * @brief Unit tests for the streaming polyphase resampler
 */

#include "audio/polyphase_resampler.h"

#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using rtsub::audio::PolyphaseResampler;

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<float> makeSine(double freq, int rate, std::size_t samples, float amplitude = 0.5f) {
    std::vector<float> out(samples);
    for (std::size_t i = 0; i < samples; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * kPi * freq * i / rate));
    }
    return out;
}

// Frequency estimate from rising zero crossings, skipping the filter warm-up
double estimateFrequency(const std::vector<float>& signal, int rate, std::size_t skip) {
    std::size_t first = 0;
    std::size_t last = 0;
    int crossings = 0;
    for (std::size_t i = skip + 1; i < signal.size(); ++i) {
        if (signal[i - 1] < 0.0f && signal[i] >= 0.0f) {
            if (crossings == 0) {
                first = i;
            }
            last = i;
            ++crossings;
        }
    }
    if (crossings < 2) {
        return 0.0;
    }
    return static_cast<double>(crossings - 1) * rate / static_cast<double>(last - first);
}

float peak(const std::vector<float>& signal, std::size_t skip) {
    float p = 0.0f;
    for (std::size_t i = skip; i < signal.size(); ++i) {
        p = std::max(p, std::fabs(signal[i]));
    }
    return p;
}

}  // namespace

TEST(PolyphaseResamplerTest, RejectsNonPositiveRates) {
    EXPECT_THROW(PolyphaseResampler(0, 16000), std::invalid_argument);
    EXPECT_THROW(PolyphaseResampler(48000, -1), std::invalid_argument);
}

TEST(PolyphaseResamplerTest, EqualRatesBypass) {
    PolyphaseResampler resampler(16000, 16000);
    EXPECT_TRUE(resampler.isBypass());

    std::vector<float> input = {0.1f, -0.2f, 0.3f};
    std::vector<float> out;
    resampler.process(input.data(), input.size(), out);
    EXPECT_EQ(out, input);
}

TEST(PolyphaseResamplerTest, Downsample48kProducesOneThirdOfTheSamples) {
    PolyphaseResampler resampler(48000, 16000);
    EXPECT_FALSE(resampler.isBypass());

    auto input = makeSine(1000.0, 48000, 48000);
    std::vector<float> out;
    resampler.process(input.data(), input.size(), out);
    EXPECT_EQ(out.size(), 16000u);
}

TEST(PolyphaseResamplerTest, Downsample48kKeepsToneFrequencyAndLevel) {
    PolyphaseResampler resampler(48000, 16000);
    auto input = makeSine(1000.0, 48000, 48000);
    std::vector<float> out;
    resampler.process(input.data(), input.size(), out);

    double freq = estimateFrequency(out, 16000, 200);
    EXPECT_NEAR(freq, 1000.0, 10.0);
    EXPECT_NEAR(peak(out, 200), 0.5f, 0.05f);
}

TEST(PolyphaseResamplerTest, StreamingMatchesSingleBlock) {
    auto input = makeSine(440.0, 48000, 9600);

    PolyphaseResampler whole(48000, 16000);
    std::vector<float> expected;
    whole.process(input.data(), input.size(), expected);

    PolyphaseResampler streamed(48000, 16000);
    std::vector<float> actual;
    const std::size_t blockSizes[] = {1, 7, 480, 1000, 13};
    std::size_t offset = 0;
    std::size_t b = 0;
    while (offset < input.size()) {
        std::size_t n = std::min(blockSizes[b++ % 5], input.size() - offset);
        streamed.process(input.data() + offset, n, actual);
        offset += n;
    }

    ASSERT_EQ(actual.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(actual[i], expected[i], 1e-5f) << "at " << i;
    }
}

TEST(PolyphaseResamplerTest, Downsample44kKeepsToneFrequency) {
    PolyphaseResampler resampler(44100, 16000);
    EXPECT_GT(resampler.tapsPerPhase(), 16u);

    auto input = makeSine(1000.0, 44100, 44100);
    std::vector<float> out;
    resampler.process(input.data(), input.size(), out);

    EXPECT_NEAR(static_cast<double>(out.size()), 16000.0, 2.0);
    EXPECT_NEAR(estimateFrequency(out, 16000, 200), 1000.0, 10.0);
}

TEST(PolyphaseResamplerTest, RemovesContentAboveOutputNyquist) {
    PolyphaseResampler resampler(48000, 16000);
    auto input = makeSine(12000.0, 48000, 48000);
    std::vector<float> out;
    resampler.process(input.data(), input.size(), out);

    EXPECT_LT(peak(out, 200), 0.02f);
}

TEST(PolyphaseResamplerTest, ResetClearsHistory) {
    PolyphaseResampler resampler(48000, 16000);
    std::vector<float> loud(3000, 1.0f);
    std::vector<float> out;
    resampler.process(loud.data(), loud.size(), out);

    resampler.reset();
    out.clear();
    std::vector<float> silence(300, 0.0f);
    resampler.process(silence.data(), silence.size(), out);
    ASSERT_EQ(out.size(), 100u);
    for (float s : out) {
        EXPECT_FLOAT_EQ(s, 0.0f);
    }
}
