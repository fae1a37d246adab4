#ifndef RTSUB_CONFIG_LOADER_H
#define RTSUB_CONFIG_LOADER_H

#include "core/subtitle_constants.h"

#include <filesystem>
#include <string>

namespace rtsub {

constexpr const char* DEFAULT_CONFIG_FILE = "subtitle_config.json";

enum class SourceKind { Monitor, Mic };

SourceKind parseSourceKind(const std::string& str);
const char* sourceKindToString(SourceKind kind);
SourceKind otherSourceKind(SourceKind kind);

struct TranslationConfig {
    std::string apiKey;  // Empty = OPENAI_API_KEY from the environment
    std::string model = "gpt-4o-mini";
    std::string endpoint = "https://api.openai.com/v1/chat/completions";
    int timeoutMs = SubtitleConstants::TRANSLATION_TIMEOUT_MS;
    int maxTokens = SubtitleConstants::TRANSLATION_MAX_TOKENS;
    float temperature = SubtitleConstants::TRANSLATION_TEMPERATURE;
    int debounceMs = SubtitleConstants::DEBOUNCE_MS;
};

struct VadConfig {
    std::string modelPath = "data/models/silero_vad_v6.onnx";
    float threshold = SubtitleConstants::VAD_THRESHOLD;
    int silenceFrames = SubtitleConstants::VAD_SILENCE_FRAMES;
    int maxBufferFrames = SubtitleConstants::VAD_MAX_BUFFER_FRAMES;
    int intraOpThreads = 1;
};

struct IpcConfig {
    std::string eventsEndpoint = SubtitleConstants::EVENTS_ENDPOINT;
    std::string commandsEndpoint = SubtitleConstants::COMMANDS_ENDPOINT;
    int commandPollMs = SubtitleConstants::COMMAND_POLL_MS;
};

struct WorkerConfig {
    std::string asrServer = "http://localhost:8000";
    int asrTimeoutMs = SubtitleConstants::ASR_TIMEOUT_MS;

    SourceKind source = SourceKind::Monitor;
    std::string monitorDevice;  // Empty = default sink monitor
    std::string micDevice;      // Empty = ALSA "default"
    int micSampleRate = SubtitleConstants::DEFAULT_MIC_SAMPLE_RATE;

    std::string direction = "en→zh";

    TranslationConfig translation;
    VadConfig vad;
    IpcConfig ipc;

    // OpenCC configuration used for simplified -> traditional conversion
    std::string openccConfig = "s2twp.json";
};

/**
 * @brief Load worker settings from a JSON file
 *
 * Missing keys keep their defaults. Malformed nested sections are reset to
 * defaults with a warning. An empty API key is filled from OPENAI_API_KEY.
 *
 * @return false when the file is missing or not valid JSON (outConfig then holds defaults)
 */
bool loadWorkerConfig(const std::filesystem::path& configPath, WorkerConfig& outConfig,
                      bool verbose = true);

}  // namespace rtsub

#endif  // RTSUB_CONFIG_LOADER_H
