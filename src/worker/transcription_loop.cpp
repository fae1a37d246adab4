#include "worker/transcription_loop.h"

#include "core/errors.h"
#include "core/subtitle_constants.h"
#include "logging/logger.h"

#include <chrono>

namespace rtsub {
namespace worker {

TranscriptionLoop::TranscriptionLoop(std::shared_ptr<Channel<vad::SpeechSegment>> segments,
                                     std::shared_ptr<asr::Transcriber> transcriber,
                                     std::shared_ptr<ipc::EventSink> events,
                                     TranscriptHandler onTranscript,
                                     LanguageHint languageHint)
    : segments_(std::move(segments)),
      transcriber_(std::move(transcriber)),
      events_(std::move(events)),
      onTranscript_(std::move(onTranscript)),
      languageHint_(std::move(languageHint)) {}

void TranscriptionLoop::run(const std::atomic<bool>& stop) {
    LOG_INFO("[ASR] Transcription thread started");
    while (!stop.load(std::memory_order_acquire)) {
        vad::SpeechSegment segment;
        PopStatus status = segments_->popFor(segment, std::chrono::milliseconds(500));
        if (status == PopStatus::Closed) {
            break;
        }
        if (status == PopStatus::Timeout) {
            continue;
        }
        handleSegment(segment);
    }
    LOG_INFO("[ASR] Transcription thread stopped ({} requests)", requestsSent());
}

void TranscriptionLoop::handleSegment(const vad::SpeechSegment& segment) {
    if (segment.size() < SubtitleConstants::MIN_SEGMENT_SAMPLES) {
        LOG_DEBUG("[ASR] Skipping {} sample segment", segment.size());
        return;
    }

    try {
        std::string hint = languageHint_ ? languageHint_() : std::string();
        requestsSent_.fetch_add(1, std::memory_order_relaxed);
        asr::TranscriptResult result = transcriber_->transcribe(segment, hint);
        accept(result);
    } catch (const RemoteServiceError& e) {
        LOG_WARN("[ASR] Transcription failed ({}): {}", remoteErrorKindToString(e.kind()),
                 e.what());
        if (e.isTimeout()) {
            std::size_t drained = segments_->drain();
            if (drained > 0) {
                segmentsDrained_.fetch_add(drained, std::memory_order_relaxed);
                LOG_INFO("[ASR] Cleared {} stale segments after timeout", drained);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[ASR] Unexpected transcription error: {}", e.what());
    }
}

bool TranscriptionLoop::accept(const asr::TranscriptResult& result) {
    {
        std::lock_guard<std::mutex> lock(transcriptMutex_);
        LOG_INFO("[ASR] lang={} text={} same={}", result.language, result.text,
                 result.text == currentTranscript_);
        if (result.text.empty() || result.text == currentTranscript_) {
            return false;
        }
        currentTranscript_ = result.text;
    }
    events_->emit(ipc::TextUpdate{result.text, ""});
    if (onTranscript_) {
        onTranscript_(result.text);
    }
    return true;
}

std::string TranscriptionLoop::currentTranscript() const {
    std::lock_guard<std::mutex> lock(transcriptMutex_);
    return currentTranscript_;
}

}  // namespace worker
}  // namespace rtsub
