#include "core/errors.h"
#include "logging/logger.h"
#include "vad/speech_model.h"

#include <algorithm>
#include <filesystem>
#include <onnxruntime_cxx_api.h>
#include <vector>

namespace rtsub {
namespace vad {

const char* inferenceStatusToString(InferenceStatus status) {
    switch (status) {
    case InferenceStatus::Ok:
        return "ok";
    case InferenceStatus::InvalidInput:
        return "invalid_input";
    case InferenceStatus::InvalidConfig:
        return "invalid_config";
    case InferenceStatus::Error:
    default:
        return "error";
    }
}

namespace {

Ort::Env& ortEnv() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "silero_vad");
    return env;
}

class SileroSpeechModel final : public SpeechProbabilityModel {
   public:
    explicit SileroSpeechModel(const VadConfig& config)
        : memoryInfo_(Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)) {
        if (config.modelPath.empty()) {
            throw InferenceError("vad.model_path is empty");
        }
        if (!std::filesystem::exists(config.modelPath)) {
            throw InferenceError("vad.model_path does not exist: " + config.modelPath);
        }
        try {
            Ort::SessionOptions options;
            options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
            options.SetIntraOpNumThreads(std::max(1, config.intraOpThreads));
            options.SetInterOpNumThreads(1);
            session_ = std::make_unique<Ort::Session>(ortEnv(), config.modelPath.c_str(), options);
        } catch (const Ort::Exception& e) {
            throw InferenceError(std::string("failed to load Silero VAD: ") + e.what());
        }
        LOG_INFO("[VAD] Silero model loaded from {}", config.modelPath);
    }

    const char* name() const override {
        return "silero_v6";
    }

    std::size_t frameSamples() const override {
        return SubtitleConstants::VAD_FRAME_SAMPLES;
    }

    InferenceResult infer(const float* frame, RecurrentState& state, float& probability) override {
        if (!frame) {
            return {InferenceStatus::InvalidInput, "null frame"};
        }
        if (!session_) {
            return {InferenceStatus::InvalidConfig, "ORT session is not initialized"};
        }

        constexpr auto kFrame = static_cast<int64_t>(SubtitleConstants::VAD_FRAME_SAMPLES);
        constexpr auto kState = static_cast<int64_t>(SubtitleConstants::VAD_STATE_SIZE);
        const std::array<int64_t, 2> inputShape{1, kFrame};
        const std::array<int64_t, 3> stateShape{1, 1, kState};

        std::array<Ort::Value, 3> inputs{
            Ort::Value::CreateTensor<float>(memoryInfo_, const_cast<float*>(frame),
                                            static_cast<size_t>(kFrame), inputShape.data(),
                                            inputShape.size()),
            Ort::Value::CreateTensor<float>(memoryInfo_, state.h.data(), state.h.size(),
                                            stateShape.data(), stateShape.size()),
            Ort::Value::CreateTensor<float>(memoryInfo_, state.c.data(), state.c.size(),
                                            stateShape.data(), stateShape.size()),
        };

        const char* inputNames[] = {"input", "h", "c"};
        const char* outputNames[] = {"speech_probs", "hn", "cn"};

        try {
            auto outputs = session_->Run(Ort::RunOptions{nullptr}, inputNames, inputs.data(),
                                         inputs.size(), outputNames, 3);
            if (outputs.size() != 3) {
                return {InferenceStatus::Error, "unexpected output count"};
            }
            probability = outputs[0].GetTensorData<float>()[0];

            const float* hn = outputs[1].GetTensorData<float>();
            const float* cn = outputs[2].GetTensorData<float>();
            std::copy(hn, hn + kState, state.h.begin());
            std::copy(cn, cn + kState, state.c.begin());
            return {InferenceStatus::Ok, ""};
        } catch (const Ort::Exception& e) {
            return {InferenceStatus::Error, e.what()};
        }
    }

   private:
    Ort::MemoryInfo memoryInfo_;
    std::unique_ptr<Ort::Session> session_;
};

}  // namespace

std::unique_ptr<SpeechProbabilityModel> createSileroSpeechModel(const VadConfig& config) {
    return std::make_unique<SileroSpeechModel>(config);
}

}  // namespace vad
}  // namespace rtsub
