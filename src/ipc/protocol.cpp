#include "ipc/protocol.h"

#include <nlohmann/json.hpp>

namespace rtsub {
namespace ipc {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

void trimNull(std::string& value) {
    auto pos = value.find('\0');
    if (pos != std::string::npos) {
        value.erase(pos);
    }
}

}  // namespace

std::string encodeEvent(const OutboundEvent& event) {
    nlohmann::json j = std::visit(
        Overloaded{
            [](const TextUpdate& e) {
                return nlohmann::json{{"original", e.original}, {"translated", e.translated}};
            },
            [](const DirectionChanged& e) { return nlohmann::json{{"direction", e.direction}}; },
            [](const SourceChanged& e) { return nlohmann::json{{"source", e.source}}; },
            [](const HealthEvent& e) {
                return nlohmann::json{{"health", e.status}, {"detail", e.detail}};
            },
        },
        event);
    // Invalid UTF-8 from upstream services must not abort the worker
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<OutboundEvent> decodeEvent(const std::string& raw) {
    auto j = nlohmann::json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    auto stringField = [&j](const char* key) -> std::optional<std::string> {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return std::nullopt;
        }
        return it->get<std::string>();
    };

    if (auto original = stringField("original")) {
        return TextUpdate{*original, stringField("translated").value_or("")};
    }
    if (j.contains("translated")) {
        return TextUpdate{"", stringField("translated").value_or("")};
    }
    if (auto direction = stringField("direction")) {
        return DirectionChanged{*direction};
    }
    if (auto source = stringField("source")) {
        return SourceChanged{*source};
    }
    if (auto health = stringField("health")) {
        return HealthEvent{*health, stringField("detail").value_or("")};
    }
    return std::nullopt;
}

Command parseCommand(const std::string& raw) {
    Command command;
    command.raw = raw;

    auto colonPos = raw.find(':');
    if (colonPos != std::string::npos) {
        command.name = raw.substr(0, colonPos);
        command.payload = raw.substr(colonPos + 1);
    } else {
        command.name = raw;
    }
    trimNull(command.name);
    trimNull(command.payload);

    if (command.name == "toggle") {
        command.type = CommandType::Toggle;
    } else if (command.name == "switch_source") {
        command.type = CommandType::SwitchSource;
    } else if (command.name == "stop") {
        command.type = CommandType::Stop;
    } else if (command.name == "set_direction" && colonPos != std::string::npos) {
        command.type = CommandType::SetDirection;
    }
    return command;
}

std::string commandTypeToString(CommandType type) {
    switch (type) {
    case CommandType::Toggle:
        return "toggle";
    case CommandType::SetDirection:
        return "set_direction";
    case CommandType::SwitchSource:
        return "switch_source";
    case CommandType::Stop:
        return "stop";
    case CommandType::Unknown:
    default:
        return "unknown";
    }
}

std::string makeSetDirectionCommand(const std::string& direction) {
    return "set_direction:" + direction;
}

}  // namespace ipc
}  // namespace rtsub
