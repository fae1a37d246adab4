#include "worker/stage_thread.h"

#include "logging/logger.h"

namespace rtsub {
namespace worker {

StageThread::StageThread(std::string name, std::function<void()> body)
    : name_(std::move(name)), done_(std::make_shared<std::atomic<bool>>(false)) {
    // done_ is shared so a detached thread never touches a destroyed StageThread
    auto done = done_;
    std::string threadName = name_;
    thread_ = std::thread([done, threadName, body = std::move(body)]() {
        try {
            body();
        } catch (const std::exception& e) {
            LOG_ERROR("[{}] Thread terminated by exception: {}", threadName, e.what());
        }
        done->store(true, std::memory_order_release);
    });
}

StageThread::~StageThread() {
    if (thread_.joinable()) {
        if (isFinished()) {
            thread_.join();
        } else {
            LOG_WARN("[{}] Still running at destruction, detaching", name_);
            thread_.detach();
        }
    }
}

bool StageThread::joinFor(std::chrono::milliseconds timeout) {
    if (!thread_.joinable()) {
        return true;
    }
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!isFinished() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (isFinished()) {
        thread_.join();
        return true;
    }
    LOG_WARN("[{}] Did not stop within {} ms, abandoning thread", name_, timeout.count());
    thread_.detach();
    return false;
}

}  // namespace worker
}  // namespace rtsub
