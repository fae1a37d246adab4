/**
 * @file test_transcription_loop.cpp
 * @brief Deduplication, backlog shedding and minimum length of the ASR stage
 */

#include "support/fakes.h"
#include "worker/transcription_loop.h"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <thread>
#include <vector>

using namespace rtsub;
using namespace std::chrono_literals;
using rtsub::testing_support::RecordingEventSink;
using rtsub::testing_support::ScriptedTranscriber;
using rtsub::testing_support::waitUntil;

class TranscriptionLoopTest : public ::testing::Test {
   protected:
    void SetUp() override {
        segments_ = std::make_shared<worker::Channel<vad::SpeechSegment>>();
        transcriber_ = std::make_shared<ScriptedTranscriber>();
        loop_ = std::make_unique<worker::TranscriptionLoop>(
            segments_, transcriber_, sink_,
            [this](const std::string& text) { forwarded_.push_back(text); },
            [this] { return hint_; });
    }

    vad::SpeechSegment segment(std::size_t samples = 16000) {
        return vad::SpeechSegment(samples, 0.1f);
    }

    std::shared_ptr<worker::Channel<vad::SpeechSegment>> segments_;
    std::shared_ptr<ScriptedTranscriber> transcriber_;
    std::shared_ptr<RecordingEventSink> sink_ = std::make_shared<RecordingEventSink>();
    std::vector<std::string> forwarded_;
    std::string hint_ = "en";
    std::unique_ptr<worker::TranscriptionLoop> loop_;
};

TEST_F(TranscriptionLoopTest, NewTranscriptIsEmittedAndForwarded) {
    transcriber_->enqueueText("hello world");
    loop_->handleSegment(segment());

    auto updates = sink_->eventsOf<ipc::TextUpdate>();
    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].original, "hello world");
    EXPECT_EQ(updates[0].translated, "");
    EXPECT_EQ(forwarded_, std::vector<std::string>{"hello world"});
    EXPECT_EQ(loop_->currentTranscript(), "hello world");
}

TEST_F(TranscriptionLoopTest, RepeatedTranscriptIsSuppressed) {
    transcriber_->enqueueText("same");
    transcriber_->enqueueText("same");
    transcriber_->enqueueText("different");
    loop_->handleSegment(segment());
    loop_->handleSegment(segment());
    loop_->handleSegment(segment());

    EXPECT_EQ(sink_->eventsOf<ipc::TextUpdate>().size(), 2u);
    EXPECT_EQ(forwarded_, (std::vector<std::string>{"same", "different"}));
    EXPECT_EQ(loop_->requestsSent(), 3u);
}

TEST_F(TranscriptionLoopTest, EmptyTranscriptIsIgnored) {
    transcriber_->enqueueText("");
    loop_->handleSegment(segment());
    EXPECT_TRUE(sink_->events().empty());
    EXPECT_TRUE(forwarded_.empty());
}

TEST_F(TranscriptionLoopTest, ShortSegmentsAreNotSent) {
    loop_->handleSegment(segment(SubtitleConstants::MIN_SEGMENT_SAMPLES - 1));
    EXPECT_EQ(loop_->requestsSent(), 0u);
    EXPECT_TRUE(transcriber_->sizes().empty());

    transcriber_->enqueueText("ok");
    loop_->handleSegment(segment(SubtitleConstants::MIN_SEGMENT_SAMPLES));
    EXPECT_EQ(loop_->requestsSent(), 1u);
}

TEST_F(TranscriptionLoopTest, LanguageHintIsReadPerRequest) {
    transcriber_->enqueueText("one");
    transcriber_->enqueueText("two");
    loop_->handleSegment(segment());
    hint_ = "zh";
    loop_->handleSegment(segment());
    EXPECT_EQ(transcriber_->hints(), (std::vector<std::string>{"en", "zh"}));
}

TEST_F(TranscriptionLoopTest, TimeoutDiscardsQueuedSegments) {
    segments_->push(segment());
    segments_->push(segment());
    transcriber_->enqueueTimeout();

    loop_->handleSegment(segment());
    EXPECT_EQ(segments_->size(), 0u);
    EXPECT_EQ(loop_->segmentsDrained(), 2u);
    EXPECT_TRUE(sink_->events().empty());
}

TEST_F(TranscriptionLoopTest, OtherFailuresKeepQueuedSegments) {
    segments_->push(segment());
    transcriber_->enqueue([]() -> asr::TranscriptResult {
        throw RemoteServiceError(RemoteServiceError::Kind::HttpStatus, "500", 500);
    });
    EXPECT_NO_THROW(loop_->handleSegment(segment()));
    EXPECT_EQ(segments_->size(), 1u);
    EXPECT_EQ(loop_->segmentsDrained(), 0u);
}

TEST_F(TranscriptionLoopTest, RunProcessesSegmentsUntilChannelCloses) {
    transcriber_->enqueueText("first");
    transcriber_->enqueueText("second");
    std::atomic<bool> stop{false};
    std::thread runner([&] { loop_->run(stop); });

    segments_->push(segment());
    segments_->push(segment());
    ASSERT_TRUE(waitUntil([&] { return sink_->events().size() == 2; }));

    segments_->close();
    runner.join();
    EXPECT_EQ(loop_->currentTranscript(), "second");
}

TEST_F(TranscriptionLoopTest, RunReturnsWhenStopIsSet) {
    std::atomic<bool> stop{false};
    std::thread runner([&] { loop_->run(stop); });
    std::this_thread::sleep_for(50ms);
    stop = true;
    runner.join();
    SUCCEED();
}
