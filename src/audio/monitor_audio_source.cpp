#include "audio/monitor_audio_source.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <mutex>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <spa/param/props.h>

namespace rtsub {
namespace audio {

namespace {

constexpr int kConnectTimeoutSec = 5;

void ensurePipewireInit() {
    static std::once_flag once;
    std::call_once(once, []() { pw_init(nullptr, nullptr); });
}

}  // namespace

struct MonitorStreamCallbacks {
    // PipeWire realtime thread: only the non-blocking ring push happens here
    static void onProcess(void* userdata) {
        auto* self = static_cast<MonitorAudioSource*>(userdata);
        struct pw_buffer* buf = pw_stream_dequeue_buffer(self->stream_);
        if (!buf) {
            return;
        }
        struct spa_buffer* spa_buf = buf->buffer;
        const auto* samples = static_cast<const float*>(spa_buf->datas[0].data);
        if (samples && spa_buf->datas[0].chunk) {
            uint32_t offset = spa_buf->datas[0].chunk->offset;
            uint32_t n_samples = spa_buf->datas[0].chunk->size / sizeof(float);
            self->pump_.pushFromDevice(samples + offset / sizeof(float), n_samples);
        }
        pw_stream_queue_buffer(self->stream_, buf);
    }

    static void onStateChanged(void* userdata, enum pw_stream_state old_state,
                               enum pw_stream_state state, const char* error) {
        (void)old_state;
        auto* self = static_cast<MonitorAudioSource*>(userdata);
        if (state == PW_STREAM_STATE_ERROR) {
            self->streamError_ = error ? error : "unknown error";
            LOG_ERROR("[Monitor] Stream error: {}", self->streamError_);
        } else {
            LOG_DEBUG("[Monitor] Stream state: {}", pw_stream_state_as_string(state));
        }
        self->streamState_.store(static_cast<int>(state), std::memory_order_release);
        pw_thread_loop_signal(self->loop_, false);
    }

    static void onParamChanged(void* userdata, uint32_t id, const struct spa_pod* param) {
        auto* self = static_cast<MonitorAudioSource*>(userdata);
        if (id != SPA_PARAM_Format || param == nullptr) {
            return;
        }
        struct spa_audio_info_raw info;
        if (spa_format_audio_raw_parse(param, &info) < 0) {
            return;
        }
        if (info.rate > 0) {
            self->pump_.setNativeRate(static_cast<int>(info.rate));
        }
    }
};

static const struct pw_stream_events kMonitorStreamEvents = {
    .version = PW_VERSION_STREAM_EVENTS,
    .state_changed = MonitorStreamCallbacks::onStateChanged,
    .param_changed = MonitorStreamCallbacks::onParamChanged,
    .process = MonitorStreamCallbacks::onProcess,
};

MonitorAudioSource::MonitorAudioSource(std::string device, int preferredRate)
    : device_(std::move(device)),
      preferredRate_(preferredRate),
      pump_("Monitor", SubtitleConstants::CAPTURE_RING_CAPACITY) {}

MonitorAudioSource::~MonitorAudioSource() {
    stop();
}

void MonitorAudioSource::start(ChunkCallback callback) {
    if (running_.load(std::memory_order_acquire)) {
        throw DeviceError("monitor capture already running");
    }
    ensurePipewireInit();

    loop_ = pw_thread_loop_new("rtsub-monitor", nullptr);
    if (!loop_) {
        throw DeviceError("failed to create PipeWire thread loop");
    }

    struct pw_properties* props =
        pw_properties_new(PW_KEY_MEDIA_TYPE, "Audio", PW_KEY_MEDIA_CATEGORY, "Capture",
                          PW_KEY_MEDIA_ROLE, "Communication", PW_KEY_NODE_DESCRIPTION,
                          "Realtime Subtitle Capture", nullptr);
    if (device_.empty()) {
        pw_properties_set(props, PW_KEY_STREAM_CAPTURE_SINK, "true");
    } else {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, device_.c_str());
    }

    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_), "realtime-subtitle-capture",
                                   props, &kMonitorStreamEvents, this);
    if (!stream_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        throw DeviceError("failed to create PipeWire capture stream");
    }

    streamState_.store(static_cast<int>(PW_STREAM_STATE_UNCONNECTED), std::memory_order_release);
    streamError_.clear();
    pump_.start(preferredRate_, std::move(callback));

    uint8_t buffer[1024];
    struct spa_pod_builder builder = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));
    struct spa_audio_info_raw info = {};
    info.format = SPA_AUDIO_FORMAT_F32;
    info.channels = 1;
    info.rate = static_cast<uint32_t>(preferredRate_);
    info.position[0] = SPA_AUDIO_CHANNEL_MONO;
    const struct spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &info);

    if (pw_thread_loop_start(loop_) < 0) {
        pump_.stop();
        releaseStream();
        throw DeviceError("failed to start PipeWire thread loop");
    }

    pw_thread_loop_lock(loop_);
    int err = pw_stream_connect(
        stream_, PW_DIRECTION_INPUT, PW_ID_ANY,
        static_cast<pw_stream_flags>(PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS |
                                     PW_STREAM_FLAG_AUTOCONNECT),
        params, 1);

    bool ready = false;
    if (err >= 0) {
        for (int waited = 0; waited < kConnectTimeoutSec; ++waited) {
            int state = streamState_.load(std::memory_order_acquire);
            if (state == PW_STREAM_STATE_PAUSED || state == PW_STREAM_STATE_STREAMING) {
                ready = true;
                break;
            }
            if (state == PW_STREAM_STATE_ERROR) {
                break;
            }
            pw_thread_loop_timed_wait(loop_, 1);
        }
        int state = streamState_.load(std::memory_order_acquire);
        ready = ready || state == PW_STREAM_STATE_PAUSED || state == PW_STREAM_STATE_STREAMING;
    }
    std::string error = streamError_;
    pw_thread_loop_unlock(loop_);

    if (!ready) {
        pump_.stop();
        releaseStream();
        if (err < 0) {
            throw DeviceError("cannot connect to monitor " + deviceName() + ": " +
                              spa_strerror(err));
        }
        throw DeviceError("monitor " + deviceName() + " did not become ready" +
                          (error.empty() ? std::string() : ": " + error));
    }

    running_.store(true, std::memory_order_release);
    LOG_INFO("[Monitor] Capturing {} (requested {} Hz)", deviceName(), preferredRate_);
}

void MonitorAudioSource::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    releaseStream();
    pump_.stop();
    LOG_INFO("[Monitor] Capture stopped");
}

void MonitorAudioSource::releaseStream() {
    if (loop_) {
        pw_thread_loop_lock(loop_);
        if (stream_) {
            pw_stream_disconnect(stream_);
            pw_stream_destroy(stream_);
            stream_ = nullptr;
        }
        pw_thread_loop_unlock(loop_);
        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

}  // namespace audio
}  // namespace rtsub
