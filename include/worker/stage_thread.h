#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace rtsub {
namespace worker {

/**
 * @brief Named pipeline thread with a bounded join
 *
 * joinFor() waits up to the timeout for the body to return. A thread that
 * does not finish in time is detached and reported; it is never killed.
 */
class StageThread {
   public:
    StageThread(std::string name, std::function<void()> body);
    ~StageThread();

    StageThread(const StageThread&) = delete;
    StageThread& operator=(const StageThread&) = delete;

    const std::string& name() const {
        return name_;
    }
    bool isFinished() const {
        return done_->load(std::memory_order_acquire);
    }

    // true when the thread finished within the timeout
    bool joinFor(std::chrono::milliseconds timeout);

   private:
    std::string name_;
    std::shared_ptr<std::atomic<bool>> done_;
    std::thread thread_;
};

}  // namespace worker
}  // namespace rtsub
