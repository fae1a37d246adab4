#pragma once

#include "ipc/protocol.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace zmq {
class context_t;
class socket_t;
}  // namespace zmq

namespace rtsub {
namespace ipc {

/**
 * @brief Worker side of the two-channel link
 *
 * Connects a PUSH socket for events and a PULL socket for commands. Both
 * are unbounded (HWM 0). emit() is thread-safe; poll() never blocks.
 */
class ZmqWorkerChannels : public EventSink, public CommandSource {
   public:
    ZmqWorkerChannels(const std::string& eventsEndpoint, const std::string& commandsEndpoint);
    ~ZmqWorkerChannels() override;

    void emit(const OutboundEvent& event) override;
    std::optional<std::string> poll() override;

    // Blocks until queued events are handed to the transport or the timeout passes
    void close(std::chrono::milliseconds linger = std::chrono::milliseconds(1000));

   private:
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> eventsSocket_;
    std::unique_ptr<zmq::socket_t> commandsSocket_;
    std::mutex sendMutex_;
    std::mutex recvMutex_;
};

/**
 * @brief Presenter side: binds both endpoints
 *
 * Throws zmq::error_t when an endpoint cannot be bound.
 */
class ZmqHostChannels {
   public:
    ZmqHostChannels(std::string eventsEndpoint, std::string commandsEndpoint);
    ~ZmqHostChannels();

    // Raw event frame, or nullopt on timeout
    std::optional<std::string> receiveRaw(std::chrono::milliseconds timeout);
    std::optional<OutboundEvent> receiveEvent(std::chrono::milliseconds timeout);

    bool sendCommand(const std::string& command);

    const std::string& eventsEndpoint() const {
        return eventsEndpoint_;
    }
    const std::string& commandsEndpoint() const {
        return commandsEndpoint_;
    }

   private:
    static void cleanupIpcPath(const std::string& endpoint);

    std::string eventsEndpoint_;
    std::string commandsEndpoint_;
    std::unique_ptr<zmq::context_t> context_;
    std::unique_ptr<zmq::socket_t> eventsSocket_;
    std::unique_ptr<zmq::socket_t> commandsSocket_;
    std::mutex sendMutex_;
};

}  // namespace ipc
}  // namespace rtsub
