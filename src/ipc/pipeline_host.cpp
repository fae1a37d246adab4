#include "ipc/pipeline_host.h"

#include "logging/logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>

extern char** environ;

namespace rtsub {
namespace ipc {

std::vector<std::string> buildWorkerArgs(const HostOptions& options) {
    std::vector<std::string> args = {options.executable, "--worker", "--config",
                                     options.configPath};
    args.insert(args.end(), options.extraArgs.begin(), options.extraArgs.end());
    return args;
}

PipelineHost::PipelineHost(HostOptions options) : options_(std::move(options)) {}

PipelineHost::~PipelineHost() {
    if (pid_ > 0) {
        stop();
    }
}

bool PipelineHost::start() {
    if (pid_ > 0) {
        LOG_WARN("[Host] Worker already running (pid {})", pid_);
        return true;
    }
    if (!channels_) {
        channels_ =
            std::make_unique<ZmqHostChannels>(options_.eventsEndpoint, options_.commandsEndpoint);
    }

    std::vector<std::string> args = buildWorkerArgs(options_);
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawn(&pid, args[0].c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        LOG_ERROR("[Host] Failed to spawn worker {}: {} ({})", args[0], rc, std::strerror(rc));
        return false;
    }
    pid_ = pid;
    exitCode_ = -1;
    LOG_INFO("[Host] Worker started (pid {})", pid_);
    return true;
}

std::optional<OutboundEvent> PipelineHost::nextEvent(std::chrono::milliseconds timeout) {
    if (!channels_) {
        return std::nullopt;
    }
    return channels_->receiveEvent(timeout);
}

bool PipelineHost::sendCommand(const std::string& command) {
    if (!channels_) {
        return false;
    }
    return channels_->sendCommand(command);
}

int PipelineHost::decodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

bool PipelineHost::isWorkerRunning() {
    if (pid_ <= 0) {
        return false;
    }
    int status = 0;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        exitCode_ = decodeStatus(status);
        LOG_INFO("[Host] Worker exited with code {}", exitCode_);
        pid_ = -1;
        return false;
    }
    return true;
}

bool PipelineHost::waitForExit(std::chrono::milliseconds timeout, int& exitCode) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            exitCode = decodeStatus(status);
            return true;
        }
        if (ret < 0 && errno != EINTR) {
            exitCode = -1;
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return false;
}

int PipelineHost::stop() {
    if (pid_ <= 0) {
        return exitCode_;
    }

    if (!sendCommand("stop")) {
        LOG_WARN("[Host] Could not deliver stop command to worker");
    }

    int exitCode = -1;
    if (!waitForExit(std::chrono::milliseconds(options_.stopTimeoutMs), exitCode)) {
        // Force kill if still running
        LOG_WARN("[Host] Worker did not exit within {} ms, killing pid {}",
                 options_.stopTimeoutMs, pid_);
        kill(pid_, SIGKILL);
        int status = 0;
        if (waitpid(pid_, &status, 0) == pid_) {
            exitCode = decodeStatus(status);
        }
    }

    LOG_INFO("[Host] Worker stopped (exit code {})", exitCode);
    pid_ = -1;
    exitCode_ = exitCode;
    return exitCode;
}

}  // namespace ipc
}  // namespace rtsub
