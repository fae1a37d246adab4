#pragma once

#include "core/config_loader.h"
#include "core/subtitle_constants.h"

#include <array>
#include <cstddef>
#include <memory>
#include <string>

namespace rtsub {
namespace vad {

enum class InferenceStatus {
    Ok,
    InvalidInput,
    InvalidConfig,
    Error,
};

struct InferenceResult {
    InferenceStatus status = InferenceStatus::Error;
    std::string message;

    bool ok() const {
        return status == InferenceStatus::Ok;
    }
};

const char* inferenceStatusToString(InferenceStatus status);

/**
 * @brief Hidden/cell tensors of the recurrent detector (1x1x128 each)
 *
 * Owned by the segmenter and threaded through every infer() call.
 */
struct RecurrentState {
    std::array<float, SubtitleConstants::VAD_STATE_SIZE> h{};
    std::array<float, SubtitleConstants::VAD_STATE_SIZE> c{};

    void clear() {
        h.fill(0.0f);
        c.fill(0.0f);
    }
};

/**
 * @brief Frame-level speech probability model
 *
 * Stateless itself: state is read from and written back to the caller's
 * RecurrentState.
 */
class SpeechProbabilityModel {
   public:
    virtual ~SpeechProbabilityModel() = default;

    virtual const char* name() const = 0;

    virtual std::size_t frameSamples() const = 0;

    // frame holds frameSamples() samples at 16 kHz
    virtual InferenceResult infer(const float* frame, RecurrentState& state,
                                  float& probability) = 0;
};

// Silero VAD v6 through ONNX Runtime. Throws InferenceError when the model cannot be loaded.
std::unique_ptr<SpeechProbabilityModel> createSileroSpeechModel(const VadConfig& config);

}  // namespace vad
}  // namespace rtsub
