#pragma once

#include "ipc/protocol.h"
#include "ipc/zmq_channels.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace rtsub {
namespace ipc {

struct HostOptions {
    std::string executable;   // absolute path of the worker binary
    std::string configPath;
    std::vector<std::string> extraArgs;  // appended after --config
    std::string eventsEndpoint;
    std::string commandsEndpoint;
    int stopTimeoutMs = 8000;
};

// argv for the worker: <executable> --worker --config <path> [extra...]
std::vector<std::string> buildWorkerArgs(const HostOptions& options);

// What the presenter needs from a running worker
class WorkerConnection {
   public:
    virtual ~WorkerConnection() = default;
    virtual std::optional<OutboundEvent> nextEvent(std::chrono::milliseconds timeout) = 0;
    virtual bool sendCommand(const std::string& command) = 0;
    virtual bool isWorkerRunning() = 0;
    virtual int stop() = 0;
};

/**
 * @brief Presenter-side owner of the worker process
 *
 * Binds both channels before spawning so the worker's first events are not
 * lost. stop() asks the worker to exit with "stop", waits up to
 * stopTimeoutMs and kills it if it is still running.
 */
class PipelineHost : public WorkerConnection {
   public:
    explicit PipelineHost(HostOptions options);
    ~PipelineHost() override;

    PipelineHost(const PipelineHost&) = delete;
    PipelineHost& operator=(const PipelineHost&) = delete;

    // false when the worker could not be spawned
    bool start();

    std::optional<OutboundEvent> nextEvent(std::chrono::milliseconds timeout) override;
    bool sendCommand(const std::string& command) override;

    // Reaps the worker if it has exited
    bool isWorkerRunning() override;

    /**
     * @brief Stop the worker
     * @return Exit code, 128 + signal when killed, -1 if no worker was running
     */
    int stop() override;

    pid_t workerPid() const {
        return pid_;
    }

   private:
    static int decodeStatus(int status);
    bool waitForExit(std::chrono::milliseconds timeout, int& exitCode);

    HostOptions options_;
    std::unique_ptr<ZmqHostChannels> channels_;
    pid_t pid_ = -1;
    int exitCode_ = -1;
};

}  // namespace ipc
}  // namespace rtsub
