#pragma once

#include "asr/transcription_client.h"
#include "audio/audio_source.h"
#include "core/errors.h"
#include "ipc/protocol.h"
#include "net/http_client.h"
#include "translation/translation_backend.h"
#include "vad/speech_model.h"

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace rtsub {
namespace testing_support {

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Speech when the frame's mean absolute level exceeds 0.05
class EnergySpeechModel : public vad::SpeechProbabilityModel {
   public:
    const char* name() const override {
        return "energy";
    }
    std::size_t frameSamples() const override {
        return SubtitleConstants::VAD_FRAME_SAMPLES;
    }
    vad::InferenceResult infer(const float* frame, vad::RecurrentState& state,
                               float& probability) override {
        double sum = 0.0;
        for (std::size_t i = 0; i < frameSamples(); ++i) {
            sum += std::fabs(frame[i]);
        }
        probability = (sum / frameSamples()) > 0.05 ? 0.9f : 0.1f;
        state.h[0] += 1.0f;  // frames seen since the state was created
        return {vad::InferenceStatus::Ok, ""};
    }
};

// Fails once `failAfter` frames have succeeded
class FailingSpeechModel : public EnergySpeechModel {
   public:
    explicit FailingSpeechModel(int failAfter) : remaining_(failAfter) {}
    vad::InferenceResult infer(const float* frame, vad::RecurrentState& state,
                               float& probability) override {
        if (remaining_-- <= 0) {
            return {vad::InferenceStatus::Error, "session run failed"};
        }
        return EnergySpeechModel::infer(frame, state, probability);
    }

   private:
    int remaining_;
};

class RecordingEventSink : public ipc::EventSink {
   public:
    void emit(const ipc::OutboundEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<ipc::OutboundEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    template <typename T>
    std::vector<T> eventsOf() const {
        std::vector<T> out;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : events_) {
            if (const T* typed = std::get_if<T>(&e)) {
                out.push_back(*typed);
            }
        }
        return out;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<ipc::OutboundEvent> events_;
};

class QueueCommandSource : public ipc::CommandSource {
   public:
    void push(const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(command);
    }
    std::optional<std::string> poll() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        std::string front = queue_.front();
        queue_.pop_front();
        return front;
    }

   private:
    std::mutex mutex_;
    std::deque<std::string> queue_;
};

// Scripted transcriber: replies in order, records segment sizes and hints
class ScriptedTranscriber : public asr::Transcriber {
   public:
    using Reply = std::function<asr::TranscriptResult()>;

    void enqueue(Reply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(std::move(reply));
    }
    void enqueueText(const std::string& text, const std::string& language = "en") {
        enqueue([text, language] { return asr::TranscriptResult{language, text}; });
    }
    void enqueueTimeout() {
        enqueue([]() -> asr::TranscriptResult {
            throw RemoteServiceError(RemoteServiceError::Kind::Timeout, "timed out");
        });
    }

    asr::TranscriptResult transcribe(const std::vector<float>& samples,
                                     const std::string& languageHint) override {
        Reply reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sizes_.push_back(samples.size());
            hints_.push_back(languageHint);
            if (replies_.empty()) {
                return {"en", ""};
            }
            reply = std::move(replies_.front());
            replies_.pop_front();
        }
        return reply();
    }

    std::vector<std::size_t> sizes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sizes_;
    }
    std::vector<std::string> hints() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hints_;
    }

   private:
    mutable std::mutex mutex_;
    std::deque<Reply> replies_;
    std::vector<std::size_t> sizes_;
    std::vector<std::string> hints_;
};

/**
 * @brief Translator whose calls can be held open
 *
 * With gating enabled every call blocks until release(text) is called for
 * its input.
 */
class GatedTranslator : public translation::TranslationBackend {
   public:
    explicit GatedTranslator(bool gated = false) : gated_(gated) {}

    translation::TranslationOutput translate(const std::string& text,
                                             const languages::Direction& direction) override {
        std::unique_lock<std::mutex> lock(mutex_);
        calls_.push_back({text, direction});
        cv_.notify_all();
        if (gated_) {
            cv_.wait(lock, [&] { return released_.count(text) > 0; });
        }
        if (failWith_) {
            throw RemoteServiceError(*failWith_, "translation failed");
        }
        return {text, "[" + direction.target + "] " + text};
    }

    void release(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        released_[text] = true;
        cv_.notify_all();
    }

    void failWith(RemoteServiceError::Kind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        failWith_ = kind;
    }

    bool waitForCalls(std::size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return calls_.size() >= n; });
    }

    std::vector<std::pair<std::string, languages::Direction>> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool gated_;
    std::map<std::string, bool> released_;
    std::optional<RemoteServiceError::Kind> failWith_;
    std::vector<std::pair<std::string, languages::Direction>> calls_;
};

// Records requests and replies with a canned response (or throws)
class FakeHttpClient : public net::HttpClient {
   public:
    net::HttpResponse post(const net::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(request);
        if (error) {
            throw RemoteServiceError(*error, "transport failure");
        }
        return response;
    }

    std::string header(std::size_t index, const std::string& name) const {
        for (const auto& h : requests.at(index).headers) {
            if (h.first == name) {
                return h.second;
            }
        }
        return {};
    }

    net::HttpResponse response{200, "{}"};
    std::optional<RemoteServiceError::Kind> error;
    std::vector<net::HttpRequest> requests;

   private:
    std::mutex mutex_;
};

// Start/stop history shared by every FakeAudioSource a factory creates
class SourceJournal {
   public:
    void record(const std::string& entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }
    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};

/**
 * @brief Audio source driven by the test
 *
 * feed() hands chunks straight to the registered callback. Start failures
 * can be injected per instance.
 */
class FakeAudioSource : public audio::AudioSource {
   public:
    FakeAudioSource(SourceKind kind, bool failStart = false,
                    std::shared_ptr<SourceJournal> journal = nullptr)
        : kind_(kind), failStart_(failStart), journal_(std::move(journal)) {}

    void start(audio::ChunkCallback callback) override {
        if (failStart_) {
            note("fail");
            throw DeviceError(std::string("cannot open ") + sourceKindToString(kind_));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
        running_ = true;
        ++starts_;
        note("start");
    }
    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            note("stop");
        }
        running_ = false;
        callback_ = nullptr;
    }
    bool isRunning() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_;
    }
    SourceKind kind() const override {
        return kind_;
    }
    std::string deviceName() const override {
        return "fake";
    }

    bool feed(const audio::AudioChunk& chunk) {
        audio::ChunkCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (!callback) {
            return false;
        }
        callback(chunk);
        return true;
    }

    int starts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return starts_;
    }

   private:
    void note(const char* what) {
        if (journal_) {
            journal_->record(std::string(what) + ":" + sourceKindToString(kind_));
        }
    }

    mutable std::mutex mutex_;
    SourceKind kind_;
    bool failStart_;
    std::shared_ptr<SourceJournal> journal_;
    audio::ChunkCallback callback_;
    bool running_ = false;
    int starts_ = 0;
};

inline std::vector<float> speechSamples(std::size_t count, float amplitude = 0.5f) {
    std::vector<float> out(count);
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * 3.14159265358979 * 220.0 * i / 16000.0));
    }
    return out;
}

}  // namespace testing_support
}  // namespace rtsub
