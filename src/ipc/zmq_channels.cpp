#include "ipc/zmq_channels.h"

#include "logging/logger.h"

#include <cerrno>
#include <cstdio>
#include <zmq.hpp>

namespace rtsub {
namespace ipc {

namespace {

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

}  // namespace

ZmqWorkerChannels::ZmqWorkerChannels(const std::string& eventsEndpoint,
                                     const std::string& commandsEndpoint)
    : context_(std::make_unique<zmq::context_t>(1)) {
    eventsSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::push);
    eventsSocket_->set(zmq::sockopt::sndhwm, 0);
    eventsSocket_->set(zmq::sockopt::linger, 1000);
    eventsSocket_->connect(eventsEndpoint);

    commandsSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pull);
    commandsSocket_->set(zmq::sockopt::rcvhwm, 0);
    commandsSocket_->set(zmq::sockopt::linger, 0);
    commandsSocket_->connect(commandsEndpoint);

    LOG_INFO("[IPC] Worker connected (events={}, commands={})", eventsEndpoint, commandsEndpoint);
}

ZmqWorkerChannels::~ZmqWorkerChannels() {
    close();
}

void ZmqWorkerChannels::emit(const OutboundEvent& event) {
    std::string payload = encodeEvent(event);
    std::lock_guard<std::mutex> lock(sendMutex_);
    if (!eventsSocket_) {
        return;
    }
    try {
        eventsSocket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
    } catch (const zmq::error_t& e) {
        LOG_WARN("[IPC] Failed to emit event: {}", e.what());
    }
}

std::optional<std::string> ZmqWorkerChannels::poll() {
    std::lock_guard<std::mutex> lock(recvMutex_);
    if (!commandsSocket_) {
        return std::nullopt;
    }
    zmq::message_t message;
    try {
        auto result = commandsSocket_->recv(message, zmq::recv_flags::dontwait);
        if (!result) {
            return std::nullopt;
        }
    } catch (const zmq::error_t& e) {
        LOG_WARN("[IPC] Command receive failed: {}", e.what());
        return std::nullopt;
    }
    return std::string(static_cast<const char*>(message.data()), message.size());
}

void ZmqWorkerChannels::close(std::chrono::milliseconds linger) {
    {
        std::lock_guard<std::mutex> lock(sendMutex_);
        if (eventsSocket_) {
            eventsSocket_->set(zmq::sockopt::linger, static_cast<int>(linger.count()));
            eventsSocket_->close();
            eventsSocket_.reset();
        }
    }
    {
        std::lock_guard<std::mutex> lock(recvMutex_);
        if (commandsSocket_) {
            commandsSocket_->close();
            commandsSocket_.reset();
        }
    }
    context_.reset();
}

ZmqHostChannels::ZmqHostChannels(std::string eventsEndpoint, std::string commandsEndpoint)
    : eventsEndpoint_(std::move(eventsEndpoint)),
      commandsEndpoint_(std::move(commandsEndpoint)),
      context_(std::make_unique<zmq::context_t>(1)) {
    eventsSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pull);
    eventsSocket_->set(zmq::sockopt::rcvhwm, 0);
    eventsSocket_->set(zmq::sockopt::linger, 0);
    cleanupIpcPath(eventsEndpoint_);
    eventsSocket_->bind(eventsEndpoint_);

    commandsSocket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::push);
    commandsSocket_->set(zmq::sockopt::sndhwm, 0);
    commandsSocket_->set(zmq::sockopt::linger, 500);
    commandsSocket_->set(zmq::sockopt::sndtimeo, 1000);  // waits for the worker to connect
    cleanupIpcPath(commandsEndpoint_);
    commandsSocket_->bind(commandsEndpoint_);

    LOG_INFO("[IPC] Host listening (events={}, commands={})", eventsEndpoint_, commandsEndpoint_);
}

ZmqHostChannels::~ZmqHostChannels() {
    eventsSocket_.reset();
    commandsSocket_.reset();
    context_.reset();
    cleanupIpcPath(eventsEndpoint_);
    cleanupIpcPath(commandsEndpoint_);
}

std::optional<std::string> ZmqHostChannels::receiveRaw(std::chrono::milliseconds timeout) {
    zmq::message_t message;
    try {
        zmq::pollitem_t items[] = {{static_cast<void*>(*eventsSocket_), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, 1, timeout);
        if (!(items[0].revents & ZMQ_POLLIN)) {
            return std::nullopt;
        }
        auto result = eventsSocket_->recv(message, zmq::recv_flags::dontwait);
        if (!result) {
            return std::nullopt;
        }
    } catch (const zmq::error_t& e) {
        // EINTR when a signal arrives while polling
        if (e.num() != EINTR) {
            LOG_WARN("[IPC] Event receive failed: {}", e.what());
        }
        return std::nullopt;
    }
    return std::string(static_cast<const char*>(message.data()), message.size());
}

std::optional<OutboundEvent> ZmqHostChannels::receiveEvent(std::chrono::milliseconds timeout) {
    auto raw = receiveRaw(timeout);
    if (!raw) {
        return std::nullopt;
    }
    auto event = decodeEvent(*raw);
    if (!event) {
        LOG_WARN("[IPC] Dropping malformed event: {}", *raw);
    }
    return event;
}

bool ZmqHostChannels::sendCommand(const std::string& command) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    try {
        auto sent = commandsSocket_->send(zmq::buffer(command), zmq::send_flags::none);
        return sent.has_value();
    } catch (const zmq::error_t& e) {
        LOG_WARN("[IPC] Failed to send command '{}': {}", command, e.what());
        return false;
    }
}

void ZmqHostChannels::cleanupIpcPath(const std::string& endpoint) {
    if (!startsWith(endpoint, "ipc://")) {
        return;
    }
    std::string path = endpoint.substr(6);
    if (path.empty()) {
        return;
    }
    std::remove(path.c_str());
}

}  // namespace ipc
}  // namespace rtsub
