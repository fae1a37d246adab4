#pragma once

#include "asr/transcription_client.h"
#include "ipc/protocol.h"
#include "vad/speech_segmenter.h"
#include "worker/channel.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace rtsub {
namespace worker {

/**
 * @brief Sequential transcription of finished speech segments
 *
 * One request in flight at a time. Accepted transcripts that differ from the
 * previous one are emitted with an empty translation and forwarded to the
 * translation stage. A timed-out request discards the segments queued behind
 * it.
 */
class TranscriptionLoop {
   public:
    using TranscriptHandler = std::function<void(const std::string&)>;
    using LanguageHint = std::function<std::string()>;

    TranscriptionLoop(std::shared_ptr<Channel<vad::SpeechSegment>> segments,
                      std::shared_ptr<asr::Transcriber> transcriber,
                      std::shared_ptr<ipc::EventSink> events,
                      TranscriptHandler onTranscript, LanguageHint languageHint);

    // Runs until stop is set or the segment channel is closed
    void run(const std::atomic<bool>& stop);

    void handleSegment(const vad::SpeechSegment& segment);

    // Returns true when the text was new and emitted
    bool accept(const asr::TranscriptResult& result);

    std::string currentTranscript() const;

    uint64_t requestsSent() const {
        return requestsSent_.load(std::memory_order_relaxed);
    }
    uint64_t segmentsDrained() const {
        return segmentsDrained_.load(std::memory_order_relaxed);
    }

   private:
    std::shared_ptr<Channel<vad::SpeechSegment>> segments_;
    std::shared_ptr<asr::Transcriber> transcriber_;
    std::shared_ptr<ipc::EventSink> events_;
    TranscriptHandler onTranscript_;
    LanguageHint languageHint_;

    mutable std::mutex transcriptMutex_;
    std::string currentTranscript_;

    std::atomic<uint64_t> requestsSent_{0};
    std::atomic<uint64_t> segmentsDrained_{0};
};

}  // namespace worker
}  // namespace rtsub
