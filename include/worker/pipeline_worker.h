#pragma once

#include "asr/transcription_client.h"
#include "audio/audio_source.h"
#include "core/config_loader.h"
#include "ipc/protocol.h"
#include "translation/translation_backend.h"
#include "translation/translation_debouncer.h"
#include "vad/speech_model.h"
#include "vad/speech_segmenter.h"
#include "worker/channel.h"
#include "worker/stage_thread.h"
#include "worker/transcription_loop.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace rtsub {
namespace worker {

using SourceFactory = std::function<std::unique_ptr<audio::AudioSource>(SourceKind)>;

// Collaborators the pipeline is assembled from
struct PipelineDependencies {
    SourceFactory sourceFactory;
    std::shared_ptr<vad::SpeechProbabilityModel> speechModel;
    std::shared_ptr<asr::Transcriber> transcriber;
    std::shared_ptr<translation::TranslationBackend> translator;
};

/**
 * @brief Forwards events until closed, then drops them
 *
 * Stage threads emit through this so a thread abandoned at shutdown never
 * reaches the process-owned sink after the worker is gone.
 */
class ClosableEventSink : public ipc::EventSink {
   public:
    explicit ClosableEventSink(ipc::EventSink& target) : target_(target) {}

    void emit(const ipc::OutboundEvent& event) override;
    void close();
    bool isClosed() const;

   private:
    mutable std::mutex mutex_;
    ipc::EventSink& target_;
    bool closed_ = false;
};

/**
 * @brief Production collaborators: device sources, Silero VAD, HTTP ASR and chat translation
 *
 * Throws InferenceError / ConfigError when the VAD model or OpenCC cannot load.
 */
PipelineDependencies makeDefaultDependencies(const WorkerConfig& config);

/**
 * @brief Capture -> VAD -> ASR -> translation pipeline plus its command loop
 *
 * start() spins up the segmentation and transcription threads, then the
 * audio source (DeviceError propagates). runControlLoop() polls the command
 * source until "stop" or requestStop(). shutdown() tears everything down in
 * order: stop flag, audio source, debouncer, stage channels, event sink,
 * bounded joins.
 */
class PipelineWorker {
   public:
    PipelineWorker(WorkerConfig config, PipelineDependencies deps, ipc::EventSink& events,
                   ipc::CommandSource& commands);
    ~PipelineWorker();

    PipelineWorker(const PipelineWorker&) = delete;
    PipelineWorker& operator=(const PipelineWorker&) = delete;

    void start();

    // Returns false for "stop"
    bool handleCommand(const std::string& raw);

    void runControlLoop();
    void requestStop() {
        stopRequested_.store(true, std::memory_order_release);
    }

    void shutdown();

    SourceKind currentSource() const;
    languages::Direction direction() const;
    translation::TranslationDebouncer& debouncer() {
        return *debouncer_;
    }
    TranscriptionLoop& transcriptionLoop() {
        return *transcription_;
    }

   private:
    audio::ChunkCallback makeChunkCallback();
    void switchSource();
    static void segmentationLoop(std::shared_ptr<Channel<audio::AudioChunk>> chunks,
                                 std::shared_ptr<Channel<vad::SpeechSegment>> segments,
                                 std::shared_ptr<vad::SpeechSegmenter> segmenter,
                                 std::shared_ptr<std::atomic<bool>> stop,
                                 std::shared_ptr<ipc::EventSink> events);

    WorkerConfig config_;
    PipelineDependencies deps_;
    std::shared_ptr<ClosableEventSink> events_;
    ipc::CommandSource& commands_;

    std::shared_ptr<translation::DirectionState> directionState_;
    std::shared_ptr<std::atomic<bool>> stop_;
    std::atomic<bool> stopRequested_{false};
    bool started_ = false;
    bool shutDown_ = false;

    std::shared_ptr<Channel<audio::AudioChunk>> chunks_;
    std::shared_ptr<Channel<vad::SpeechSegment>> segments_;
    std::shared_ptr<vad::SpeechSegmenter> segmenter_;
    std::shared_ptr<translation::TranslationDebouncer> debouncer_;
    std::shared_ptr<TranscriptionLoop> transcription_;

    mutable std::mutex sourceMutex_;
    std::unique_ptr<audio::AudioSource> source_;
    SourceKind sourceKind_;

    std::unique_ptr<StageThread> vadThread_;
    std::unique_ptr<StageThread> asrThread_;
};

/**
 * @brief Entry point of the worker process
 *
 * Connects to the presenter's endpoints, runs the pipeline until "stop" or
 * a termination signal, and returns the process exit code. Startup failures
 * are reported as a "startup_failed" health event.
 */
int runWorkerProcess(const WorkerConfig& config);

}  // namespace worker
}  // namespace rtsub
