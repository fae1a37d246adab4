#include "core/config_loader.h"

#include "core/languages.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace rtsub {

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

SourceKind parseSourceKind(const std::string& str) {
    std::string lower = toLower(str);
    if (lower == "mic" || lower == "microphone") {
        return SourceKind::Mic;
    }
    return SourceKind::Monitor;
}

const char* sourceKindToString(SourceKind kind) {
    switch (kind) {
    case SourceKind::Mic:
        return "mic";
    case SourceKind::Monitor:
    default:
        return "monitor";
    }
}

SourceKind otherSourceKind(SourceKind kind) {
    return kind == SourceKind::Monitor ? SourceKind::Mic : SourceKind::Monitor;
}

static void applyApiKeyFallback(WorkerConfig& config) {
    if (config.translation.apiKey.empty()) {
        const char* env = std::getenv("OPENAI_API_KEY");
        if (env) {
            config.translation.apiKey = env;
        }
    }
}

bool loadWorkerConfig(const std::filesystem::path& configPath, WorkerConfig& outConfig,
                      bool verbose) {
    outConfig = WorkerConfig{};

    std::ifstream file(configPath);
    if (!file) {
        if (verbose) {
            LOG_WARN("Config: {} not found, using defaults", configPath.string());
        }
        applyApiKeyFallback(outConfig);
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("asr_server") && j["asr_server"].is_string()) {
            outConfig.asrServer = j["asr_server"].get<std::string>();
        }
        if (j.contains("asr_timeout_ms") && j["asr_timeout_ms"].is_number_integer()) {
            outConfig.asrTimeoutMs = j["asr_timeout_ms"].get<int>();
        }
        if (j.contains("source") && j["source"].is_string()) {
            std::string source = j["source"].get<std::string>();
            outConfig.source = parseSourceKind(source);
            std::string lower = toLower(source);
            if (verbose && lower != "monitor" && lower != "mic" && lower != "microphone") {
                LOG_WARN("Config: Unknown source '{}', falling back to 'monitor'", source);
            }
        }
        if (j.contains("monitor_device") && j["monitor_device"].is_string()) {
            outConfig.monitorDevice = j["monitor_device"].get<std::string>();
        }
        if (j.contains("mic_device") && j["mic_device"].is_string()) {
            outConfig.micDevice = j["mic_device"].get<std::string>();
        }
        if (j.contains("mic_sample_rate") && j["mic_sample_rate"].is_number_integer()) {
            outConfig.micSampleRate = j["mic_sample_rate"].get<int>();
        }
        if (j.contains("direction") && j["direction"].is_string()) {
            // Normalize through the parser so malformed values fall back to en→zh
            outConfig.direction = languages::formatDirection(
                languages::parseDirection(j["direction"].get<std::string>()));
        }
        if (j.contains("openai_api_key") && j["openai_api_key"].is_string()) {
            outConfig.translation.apiKey = j["openai_api_key"].get<std::string>();
        }
        if (j.contains("translation_model") && j["translation_model"].is_string()) {
            outConfig.translation.model = j["translation_model"].get<std::string>();
        }
        if (j.contains("opencc_config") && j["opencc_config"].is_string()) {
            outConfig.openccConfig = j["opencc_config"].get<std::string>();
        }

        if (j.contains("translation") && j["translation"].is_object()) {
            auto tr = j["translation"];
            try {
                if (tr.contains("endpoint") && tr["endpoint"].is_string()) {
                    outConfig.translation.endpoint = tr["endpoint"].get<std::string>();
                }
                if (tr.contains("timeout_ms") && tr["timeout_ms"].is_number_integer()) {
                    outConfig.translation.timeoutMs = tr["timeout_ms"].get<int>();
                }
                if (tr.contains("max_tokens") && tr["max_tokens"].is_number_integer()) {
                    outConfig.translation.maxTokens = tr["max_tokens"].get<int>();
                }
                if (tr.contains("temperature") && tr["temperature"].is_number()) {
                    outConfig.translation.temperature = tr["temperature"].get<float>();
                }
                if (tr.contains("debounce_ms") && tr["debounce_ms"].is_number_integer()) {
                    outConfig.translation.debounceMs = tr["debounce_ms"].get<int>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid translation settings, using defaults: {}",
                             e.what());
                }
                std::string apiKey = outConfig.translation.apiKey;
                std::string model = outConfig.translation.model;
                outConfig.translation = TranslationConfig{};
                outConfig.translation.apiKey = apiKey;
                outConfig.translation.model = model;
            }
        }

        if (j.contains("vad") && j["vad"].is_object()) {
            auto vad = j["vad"];
            try {
                if (vad.contains("model_path") && vad["model_path"].is_string()) {
                    outConfig.vad.modelPath = vad["model_path"].get<std::string>();
                }
                if (vad.contains("threshold") && vad["threshold"].is_number()) {
                    outConfig.vad.threshold = vad["threshold"].get<float>();
                }
                if (vad.contains("silence_frames") && vad["silence_frames"].is_number_integer()) {
                    outConfig.vad.silenceFrames = vad["silence_frames"].get<int>();
                }
                if (vad.contains("max_buffer_frames") &&
                    vad["max_buffer_frames"].is_number_integer()) {
                    outConfig.vad.maxBufferFrames = vad["max_buffer_frames"].get<int>();
                }
                if (vad.contains("intra_op_threads") &&
                    vad["intra_op_threads"].is_number_integer()) {
                    outConfig.vad.intraOpThreads = std::max(0, vad["intra_op_threads"].get<int>());
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid vad settings, using defaults: {}", e.what());
                }
                outConfig.vad = VadConfig{};
            }
        }

        if (j.contains("ipc") && j["ipc"].is_object()) {
            auto ipc = j["ipc"];
            try {
                if (ipc.contains("events_endpoint") && ipc["events_endpoint"].is_string()) {
                    outConfig.ipc.eventsEndpoint = ipc["events_endpoint"].get<std::string>();
                }
                if (ipc.contains("commands_endpoint") && ipc["commands_endpoint"].is_string()) {
                    outConfig.ipc.commandsEndpoint = ipc["commands_endpoint"].get<std::string>();
                }
                if (ipc.contains("command_poll_ms") && ipc["command_poll_ms"].is_number_integer()) {
                    outConfig.ipc.commandPollMs = ipc["command_poll_ms"].get<int>();
                }
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid ipc settings, using defaults: {}", e.what());
                }
                outConfig.ipc = IpcConfig{};
            }
        }

        // Clamp after parsing
        outConfig.asrTimeoutMs = std::clamp(outConfig.asrTimeoutMs, 1000, 300000);
        outConfig.micSampleRate = std::clamp(outConfig.micSampleRate, 8000, 192000);
        outConfig.translation.timeoutMs = std::clamp(outConfig.translation.timeoutMs, 1000, 300000);
        outConfig.translation.maxTokens = std::clamp(outConfig.translation.maxTokens, 16, 4096);
        outConfig.translation.temperature =
            std::clamp(outConfig.translation.temperature, 0.0f, 2.0f);
        outConfig.translation.debounceMs = std::clamp(outConfig.translation.debounceMs, 0, 5000);
        outConfig.vad.threshold = std::clamp(outConfig.vad.threshold, 0.01f, 0.99f);
        outConfig.vad.silenceFrames = std::max(1, outConfig.vad.silenceFrames);
        outConfig.vad.maxBufferFrames = std::max(1, outConfig.vad.maxBufferFrames);
        outConfig.ipc.commandPollMs = std::clamp(outConfig.ipc.commandPollMs, 10, 1000);

        applyApiKeyFallback(outConfig);

        if (verbose) {
            LOG_INFO("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = WorkerConfig{};
        applyApiKeyFallback(outConfig);
        return false;
    }
}

}  // namespace rtsub
