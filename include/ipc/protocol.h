#pragma once

#include <optional>
#include <string>
#include <variant>

namespace rtsub {
namespace ipc {

// {"original": ..., "translated": ...}
struct TextUpdate {
    std::string original;
    std::string translated;
};

// {"direction": "en→zh"}
struct DirectionChanged {
    std::string direction;
};

// {"source": "mic" | "monitor"}
struct SourceChanged {
    std::string source;
};

// {"health": "vad_stopped" | "startup_failed" | "source_failed", "detail": ...}
struct HealthEvent {
    std::string status;
    std::string detail;
};

constexpr const char* HEALTH_VAD_STOPPED = "vad_stopped";
constexpr const char* HEALTH_STARTUP_FAILED = "startup_failed";
constexpr const char* HEALTH_SOURCE_FAILED = "source_failed";

using OutboundEvent = std::variant<TextUpdate, DirectionChanged, SourceChanged, HealthEvent>;

std::string encodeEvent(const OutboundEvent& event);

// std::nullopt for malformed or unrecognized records
std::optional<OutboundEvent> decodeEvent(const std::string& raw);

enum class CommandType { Toggle, SetDirection, SwitchSource, Stop, Unknown };

struct Command {
    CommandType type = CommandType::Unknown;
    std::string name;     // text before ':'
    std::string payload;  // text after ':' (set_direction only)
    std::string raw;
};

/**
 * @brief Parse one inbound command string
 *
 * "toggle", "switch_source", "stop" or "set_direction:<src>→<tgt>".
 * Embedded NULs terminate the command, as sent by C clients.
 */
Command parseCommand(const std::string& raw);

std::string commandTypeToString(CommandType type);

std::string makeSetDirectionCommand(const std::string& direction);

/**
 * @brief Destination for pipeline events
 *
 * emit() may be called from any pipeline thread.
 */
class EventSink {
   public:
    virtual ~EventSink() = default;
    virtual void emit(const OutboundEvent& event) = 0;
};

// Non-blocking command inbox polled by the control loop
class CommandSource {
   public:
    virtual ~CommandSource() = default;
    virtual std::optional<std::string> poll() = 0;
};

}  // namespace ipc
}  // namespace rtsub
