/**
 * @file test_speech_segmenter.cpp
 * @brief Segmentation behaviour of the VAD stage with a deterministic energy model
 */

#include "core/errors.h"
#include "support/fakes.h"
#include "vad/speech_segmenter.h"

#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace rtsub;
using rtsub::testing_support::EnergySpeechModel;
using rtsub::testing_support::FailingSpeechModel;
using rtsub::testing_support::speechSamples;

namespace {

constexpr std::size_t kFrame = SubtitleConstants::VAD_FRAME_SAMPLES;

std::vector<vad::SpeechSegment> feedInChunks(vad::SpeechSegmenter& segmenter,
                                             const std::vector<float>& audio,
                                             std::size_t chunkSize = SubtitleConstants::CHUNK_SAMPLES) {
    std::vector<vad::SpeechSegment> segments;
    for (std::size_t offset = 0; offset < audio.size(); offset += chunkSize) {
        std::size_t n = std::min(chunkSize, audio.size() - offset);
        audio::AudioChunk chunk(audio.begin() + static_cast<std::ptrdiff_t>(offset),
                                audio.begin() + static_cast<std::ptrdiff_t>(offset + n));
        for (auto& s : segmenter.process(chunk)) {
            segments.push_back(std::move(s));
        }
    }
    return segments;
}

std::vector<float> speechThenSilence(std::size_t speech, std::size_t silence) {
    auto audio = speechSamples(speech);
    audio.resize(speech + silence, 0.0f);
    return audio;
}

double seconds(const vad::SpeechSegment& segment) {
    return static_cast<double>(segment.size()) / SubtitleConstants::TARGET_SAMPLE_RATE;
}

}  // namespace

class SpeechSegmenterTest : public ::testing::Test {
   protected:
    std::shared_ptr<EnergySpeechModel> model_ = std::make_shared<EnergySpeechModel>();
};

TEST_F(SpeechSegmenterTest, SilenceAloneProducesNothing) {
    vad::SpeechSegmenter segmenter(model_);
    auto segments = feedInChunks(segmenter, std::vector<float>(16000 * 3, 0.0f));
    EXPECT_TRUE(segments.empty());
    EXPECT_FALSE(segmenter.isAccumulating());
}

TEST_F(SpeechSegmenterTest, CarriesLeftoverSamplesBetweenChunks) {
    vad::SpeechSegmenter segmenter(model_);
    segmenter.process(audio::AudioChunk(1000, 0.0f));
    EXPECT_EQ(segmenter.leftoverSamples(), 1000 - kFrame);
    EXPECT_EQ(segmenter.framesProcessed(), 1u);

    segmenter.process(audio::AudioChunk(152, 0.0f));
    EXPECT_EQ(segmenter.leftoverSamples(), 0u);
    EXPECT_EQ(segmenter.framesProcessed(), 2u);
}

TEST_F(SpeechSegmenterTest, TwoSecondsOfSpeechEndsAfterSilenceRun) {
    vad::SpeechSegmenter segmenter(model_);
    auto segments = feedInChunks(segmenter, speechThenSilence(32000, 16000));

    ASSERT_EQ(segments.size(), 1u);
    EXPECT_GE(seconds(segments[0]), 2.0);
    EXPECT_LE(seconds(segments[0]), 2.6);
    EXPECT_EQ(segments[0].size() % kFrame, 0u);
    EXPECT_FALSE(segmenter.isAccumulating());
    EXPECT_EQ(segmenter.silenceCount(), 0);
}

TEST_F(SpeechSegmenterTest, SegmentIncludesTrailingSilenceFrames) {
    vad::SegmenterConfig config;
    config.silenceFrames = 3;
    vad::SpeechSegmenter segmenter(model_, config);

    auto audio = speechThenSilence(kFrame * 5, kFrame * 3);
    auto segments = feedInChunks(segmenter, audio, kFrame);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_EQ(segments[0].size(), kFrame * 8);
}

TEST_F(SpeechSegmenterTest, SpeechResetsSilenceRun) {
    vad::SegmenterConfig config;
    config.silenceFrames = 3;
    vad::SpeechSegmenter segmenter(model_, config);

    std::vector<float> audio;
    auto speech = speechSamples(kFrame);
    std::vector<float> silence(kFrame * 2, 0.0f);
    for (int i = 0; i < 4; ++i) {
        audio.insert(audio.end(), speech.begin(), speech.end());
        audio.insert(audio.end(), silence.begin(), silence.end());
    }
    auto segments = feedInChunks(segmenter, audio, kFrame);
    EXPECT_TRUE(segments.empty());
    EXPECT_EQ(segmenter.silenceCount(), 2);
    EXPECT_EQ(segmenter.bufferedSamples(), kFrame * 12);
}

TEST_F(SpeechSegmenterTest, LongSpeechIsForceFlushedAtMaxBuffer) {
    vad::SpeechSegmenter segmenter(model_);
    auto segments = feedInChunks(segmenter, speechThenSilence(16000 * 12, 16000));

    ASSERT_EQ(segments.size(), 2u);
    EXPECT_EQ(segments[0].size(), kFrame * SubtitleConstants::VAD_MAX_BUFFER_FRAMES);
    EXPECT_GE(seconds(segments[1]), 4.0);
    EXPECT_LE(seconds(segments[1]), 4.6);
}

TEST_F(SpeechSegmenterTest, RecurrentStateSurvivesFlush) {
    vad::SegmenterConfig config;
    config.silenceFrames = 2;
    vad::SpeechSegmenter segmenter(model_, config);

    auto segments = feedInChunks(segmenter, speechThenSilence(kFrame * 4, kFrame * 2), kFrame);
    ASSERT_EQ(segments.size(), 1u);
    EXPECT_FLOAT_EQ(segmenter.state().h[0], 6.0f);

    segmenter.process(audio::AudioChunk(kFrame, 0.0f));
    EXPECT_FLOAT_EQ(segmenter.state().h[0], 7.0f);
}

TEST_F(SpeechSegmenterTest, ModelFailureThrowsInferenceError) {
    vad::SpeechSegmenter segmenter(std::make_shared<FailingSpeechModel>(2));
    EXPECT_NO_THROW(segmenter.process(audio::AudioChunk(kFrame * 2, 0.0f)));
    EXPECT_THROW(segmenter.process(audio::AudioChunk(kFrame, 0.0f)), InferenceError);
}

TEST_F(SpeechSegmenterTest, NullModelIsRejected) {
    EXPECT_THROW(vad::SpeechSegmenter(nullptr), std::invalid_argument);
}
