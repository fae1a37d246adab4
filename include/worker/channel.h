#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace rtsub {
namespace worker {

enum class PopStatus { Item, Timeout, Closed };

/**
 * @brief Unbounded multi-producer queue between pipeline stages
 *
 * push() never blocks. After close(), pushes are rejected and consumers
 * drain what is left before seeing Closed.
 */
template <typename T>
class Channel {
   public:
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }
            queue_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    template <typename Rep, typename Period>
    PopStatus popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
            return PopStatus::Timeout;
        }
        if (queue_.empty()) {
            return PopStatus::Closed;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return PopStatus::Item;
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return false;
        }
        out = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }

    // Discards everything queued, returns how many items were dropped
    std::size_t drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t dropped = queue_.size();
        queue_.clear();
        return dropped;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

   private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}  // namespace worker
}  // namespace rtsub
