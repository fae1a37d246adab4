#include "worker/pipeline_worker.h"

#include "asr/script_normalizer.h"
#include "core/errors.h"
#include "core/signal_state.h"
#include "core/subtitle_constants.h"
#include "ipc/zmq_channels.h"
#include "logging/logger.h"
#include "net/http_client.h"
#include "translation/chat_translation_client.h"

#include <chrono>
#include <thread>

namespace rtsub {
namespace worker {

void ClosableEventSink::emit(const ipc::OutboundEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    target_.emit(event);
}

void ClosableEventSink::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool ClosableEventSink::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

PipelineDependencies makeDefaultDependencies(const WorkerConfig& config) {
    PipelineDependencies deps;
    deps.sourceFactory = [config](SourceKind kind) {
        return audio::createAudioSource(kind, config);
    };
    deps.speechModel = vad::createSileroSpeechModel(config.vad);

    auto http = net::createHttpClient();
    deps.transcriber = std::make_shared<asr::TranscriptionClient>(
        config.asrServer, config.asrTimeoutMs, http,
        asr::createOpenccNormalizer(config.openccConfig));
    deps.translator = std::make_shared<translation::ChatTranslationClient>(config.translation, http);
    return deps;
}

PipelineWorker::PipelineWorker(WorkerConfig config, PipelineDependencies deps,
                               ipc::EventSink& events, ipc::CommandSource& commands)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      events_(std::make_shared<ClosableEventSink>(events)),
      commands_(commands),
      directionState_(std::make_shared<translation::DirectionState>()),
      stop_(std::make_shared<std::atomic<bool>>(false)),
      chunks_(std::make_shared<Channel<audio::AudioChunk>>()),
      segments_(std::make_shared<Channel<vad::SpeechSegment>>()),
      sourceKind_(config_.source) {
    if (!deps_.sourceFactory || !deps_.speechModel || !deps_.transcriber || !deps_.translator) {
        throw ConfigError("PipelineWorker: incomplete dependencies");
    }
    directionState_->direction = languages::parseDirection(config_.direction);

    vad::SegmenterConfig segmenterConfig;
    segmenterConfig.threshold = config_.vad.threshold;
    segmenterConfig.silenceFrames = config_.vad.silenceFrames;
    segmenterConfig.maxBufferFrames = config_.vad.maxBufferFrames;
    segmenter_ = std::make_shared<vad::SpeechSegmenter>(deps_.speechModel, segmenterConfig);

    debouncer_ = std::make_shared<translation::TranslationDebouncer>(
        directionState_, deps_.translator,
        [sink = events_](const translation::TranslationResult& result) {
            sink->emit(ipc::TextUpdate{result.corrected, result.translated});
        },
        std::chrono::milliseconds(config_.translation.debounceMs));

    auto debouncer = debouncer_;
    transcription_ = std::make_shared<TranscriptionLoop>(
        segments_, deps_.transcriber, events_,
        [debouncer](const std::string& text) { debouncer->update(text); },
        [debouncer]() { return debouncer->direction().source; });
}

PipelineWorker::~PipelineWorker() {
    shutdown();
}

audio::ChunkCallback PipelineWorker::makeChunkCallback() {
    auto chunks = chunks_;
    return [chunks](const audio::AudioChunk& chunk) { chunks->push(chunk); };
}

void PipelineWorker::start() {
    if (started_) {
        return;
    }
    started_ = true;

    vadThread_ = std::make_unique<StageThread>(
        "vad", [chunks = chunks_, segments = segments_, segmenter = segmenter_, stop = stop_,
                events = events_]() {
            segmentationLoop(chunks, segments, segmenter, stop, events);
        });
    asrThread_ = std::make_unique<StageThread>(
        "asr", [transcription = transcription_, stop = stop_]() { transcription->run(*stop); });

    std::lock_guard<std::mutex> lock(sourceMutex_);
    source_ = deps_.sourceFactory(sourceKind_);
    source_->start(makeChunkCallback());
    LOG_INFO("[Worker] Audio capture started ({} / {})", sourceKindToString(sourceKind_),
             source_->deviceName());
}

void PipelineWorker::segmentationLoop(std::shared_ptr<Channel<audio::AudioChunk>> chunks,
                                      std::shared_ptr<Channel<vad::SpeechSegment>> segments,
                                      std::shared_ptr<vad::SpeechSegmenter> segmenter,
                                      std::shared_ptr<std::atomic<bool>> stop,
                                      std::shared_ptr<ipc::EventSink> events) {
    LOG_INFO("[VAD] Segmentation thread started");
    try {
        while (!stop->load(std::memory_order_acquire)) {
            audio::AudioChunk chunk;
            PopStatus status = chunks->popFor(chunk, std::chrono::milliseconds(500));
            if (status == PopStatus::Closed) {
                break;
            }
            if (status == PopStatus::Timeout) {
                continue;
            }
            for (auto& segment : segmenter->process(chunk)) {
                segments->push(std::move(segment));
            }
        }
    } catch (const InferenceError& e) {
        LOG_CRITICAL("[VAD] Fatal inference error, segmentation stopped: {}", e.what());
        events->emit(ipc::HealthEvent{ipc::HEALTH_VAD_STOPPED, e.what()});
        return;
    }
    LOG_INFO("[VAD] Segmentation thread stopped");
}

bool PipelineWorker::handleCommand(const std::string& raw) {
    ipc::Command command = ipc::parseCommand(raw);
    switch (command.type) {
    case ipc::CommandType::Toggle: {
        languages::Direction next = debouncer_->toggle();
        LOG_INFO("[Worker] Direction toggled to {}", languages::formatDirection(next));
        events_->emit(ipc::DirectionChanged{languages::formatDirection(next)});
        return true;
    }
    case ipc::CommandType::SetDirection: {
        languages::Direction next = languages::parseDirection(command.payload);
        debouncer_->setDirection(next);
        LOG_INFO("[Worker] Direction set to {}", languages::formatDirection(next));
        events_->emit(ipc::DirectionChanged{languages::formatDirection(next)});
        return true;
    }
    case ipc::CommandType::SwitchSource:
        switchSource();
        return true;
    case ipc::CommandType::Stop:
        LOG_INFO("[Worker] Stop requested");
        return false;
    case ipc::CommandType::Unknown:
    default:
        LOG_WARN("[Worker] Ignoring unknown command '{}'", command.raw);
        return true;
    }
}

void PipelineWorker::switchSource() {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    SourceKind previous = sourceKind_;
    SourceKind next = otherSourceKind(previous);

    if (source_) {
        source_->stop();
    }
    try {
        auto replacement = deps_.sourceFactory(next);
        replacement->start(makeChunkCallback());
        source_ = std::move(replacement);
        sourceKind_ = next;
        LOG_INFO("[Worker] Switched source to {} ({})", sourceKindToString(next),
                 source_->deviceName());
        events_->emit(ipc::SourceChanged{sourceKindToString(next)});
        return;
    } catch (const std::exception& e) {
        LOG_ERROR("[Worker] Cannot start {} source: {}", sourceKindToString(next), e.what());
        events_->emit(ipc::HealthEvent{ipc::HEALTH_SOURCE_FAILED, e.what()});
    }

    // Fall back to the previous source so capture keeps running
    try {
        if (source_) {
            source_->start(makeChunkCallback());
            LOG_INFO("[Worker] Resumed {} source", sourceKindToString(previous));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[Worker] Cannot resume {} source: {}", sourceKindToString(previous), e.what());
    }
}

void PipelineWorker::runControlLoop() {
    const auto pollInterval = std::chrono::milliseconds(config_.ipc.commandPollMs);
    LOG_INFO("[Worker] Control loop running");
    while (!stopRequested_.load(std::memory_order_acquire) && !processSignalState().shutdown) {
        auto raw = commands_.poll();
        if (raw) {
            if (!handleCommand(*raw)) {
                break;
            }
            continue;
        }
        std::this_thread::sleep_for(pollInterval);
    }
    if (processSignalState().shutdown) {
        LOG_INFO("[Worker] Signal {} received", static_cast<int>(processSignalState().received));
    }
}

void PipelineWorker::shutdown() {
    if (shutDown_) {
        return;
    }
    shutDown_ = true;
    LOG_INFO("[Worker] Shutting down");

    stop_->store(true, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(sourceMutex_);
        if (source_) {
            source_->stop();
        }
    }
    debouncer_->shutdown();
    chunks_->close();
    segments_->close();

    if (vadThread_) {
        vadThread_->joinFor(std::chrono::milliseconds(SubtitleConstants::VAD_JOIN_TIMEOUT_MS));
    }
    if (asrThread_) {
        asrThread_->joinFor(std::chrono::milliseconds(SubtitleConstants::ASR_JOIN_TIMEOUT_MS));
    }
    // An abandoned stage thread may still finish a request later
    events_->close();
    LOG_INFO("[Worker] Shutdown complete");
}

SourceKind PipelineWorker::currentSource() const {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    return sourceKind_;
}

languages::Direction PipelineWorker::direction() const {
    return debouncer_->direction();
}

int runWorkerProcess(const WorkerConfig& config) {
    installShutdownSignalHandlers();

    std::unique_ptr<ipc::ZmqWorkerChannels> channels;
    try {
        channels = std::make_unique<ipc::ZmqWorkerChannels>(config.ipc.eventsEndpoint,
                                                            config.ipc.commandsEndpoint);
    } catch (const std::exception& e) {
        LOG_CRITICAL("[Worker] Cannot connect IPC channels: {}", e.what());
        return 1;
    }

    std::unique_ptr<PipelineWorker> worker;
    try {
        worker = std::make_unique<PipelineWorker>(config, makeDefaultDependencies(config),
                                                  *channels, *channels);
        worker->start();
    } catch (const std::exception& e) {
        LOG_CRITICAL("[Worker] Startup failed: {}", e.what());
        channels->emit(ipc::HealthEvent{ipc::HEALTH_STARTUP_FAILED, e.what()});
        worker.reset();
        channels->close();
        return 1;
    }

    worker->runControlLoop();
    worker->shutdown();
    worker.reset();
    channels->close();
    return 0;
}

}  // namespace worker
}  // namespace rtsub
