#ifndef RTSUB_SUBTITLE_CONSTANTS_H
#define RTSUB_SUBTITLE_CONSTANTS_H

#include <cstddef>

// Constants shared across pipeline stages

namespace SubtitleConstants {

// Pipeline audio format (mono float32)
constexpr int TARGET_SAMPLE_RATE = 16000;
constexpr std::size_t CHUNK_SAMPLES = 8000;  // 0.5 s at 16 kHz

// Default native capture rates
constexpr int DEFAULT_MONITOR_SAMPLE_RATE = 48000;
constexpr int DEFAULT_MIC_SAMPLE_RATE = 48000;

// Capture ring buffer holds ~4 s at the highest supported native rate
constexpr std::size_t CAPTURE_RING_CAPACITY = 192000 * 4;

// Voice activity detection (Silero v6, 36 ms frames)
constexpr std::size_t VAD_FRAME_SAMPLES = 576;
constexpr std::size_t VAD_STATE_SIZE = 128;
constexpr float VAD_THRESHOLD = 0.5f;
constexpr int VAD_SILENCE_FRAMES = 14;        // ~0.5 s of trailing silence
constexpr int VAD_MAX_BUFFER_FRAMES = 222;    // ~8 s forced flush
constexpr std::size_t MIN_SEGMENT_SAMPLES = TARGET_SAMPLE_RATE / 8;  // 125 ms

// Remote services
constexpr int ASR_TIMEOUT_MS = 45000;
constexpr int TRANSLATION_TIMEOUT_MS = 30000;
constexpr int TRANSLATION_MAX_TOKENS = 400;
constexpr float TRANSLATION_TEMPERATURE = 0.1f;
constexpr int DEBOUNCE_MS = 400;

// Worker control loop
constexpr int COMMAND_POLL_MS = 100;
constexpr int VAD_JOIN_TIMEOUT_MS = 3000;
constexpr int ASR_JOIN_TIMEOUT_MS = 5000;
constexpr int WORKER_STOP_TIMEOUT_MS = 8000;

// ZeroMQ endpoints (presenter binds, worker connects)
constexpr const char* EVENTS_ENDPOINT = "ipc:///tmp/realtime_subtitle_events.sock";
constexpr const char* COMMANDS_ENDPOINT = "ipc:///tmp/realtime_subtitle_commands.sock";

constexpr const char* DEFAULT_LOG_FILE = "subtitle.log";

}  // namespace SubtitleConstants

#endif  // RTSUB_SUBTITLE_CONSTANTS_H
