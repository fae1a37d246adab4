#pragma once

#include "core/languages.h"
#include "translation/translation_backend.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace rtsub {
namespace translation {

/**
 * @brief Shared translation state, guarded by one mutex
 *
 * Shared between the pipeline and the debouncer. The mutex is never held
 * across a network call.
 */
struct DirectionState {
    std::mutex mutex;
    languages::Direction direction;
    std::string pendingText;     // latest transcript seen by update()
    std::string lastTranslated;  // last text actually dispatched
    uint64_t sequence = 0;       // bumped on every dispatch
};

struct TranslationResult {
    uint64_t sequence = 0;
    languages::Direction direction;
    std::string source;
    std::string corrected;
    std::string translated;
};

// True when text ends with . ? ! or the fullwidth 。？！
bool endsWithSentenceTerminal(const std::string& text);

/**
 * @brief Coalesces transcript updates into translation requests
 *
 * update() translates immediately on sentence-final punctuation and
 * otherwise (re)arms a one-shot timer. When the timer fires, the freshest
 * pending text is dispatched on its own thread, so a slow request never
 * delays the next firing. Every dispatch takes a new sequence number and a
 * snapshot of the direction; a completed result is delivered only if no
 * newer dispatch happened in the meantime.
 */
class TranslationDebouncer {
   public:
    using ResultCallback = std::function<void(const TranslationResult&)>;

    TranslationDebouncer(std::shared_ptr<DirectionState> state,
                         std::shared_ptr<TranslationBackend> backend, ResultCallback callback,
                         std::chrono::milliseconds debounce = std::chrono::milliseconds(400));
    ~TranslationDebouncer();

    TranslationDebouncer(const TranslationDebouncer&) = delete;
    TranslationDebouncer& operator=(const TranslationDebouncer&) = delete;

    void update(const std::string& text);

    // Dispatch text on the calling thread (skipped when empty or already translated)
    void translateNow(const std::string& text);

    // Swap source/target, clear the cache, return the new direction
    languages::Direction toggle();
    void setDirection(const languages::Direction& direction);
    languages::Direction direction() const;

    bool timerArmed() const;

    /**
     * @brief Cancel the pending timer and stop delivering results
     *
     * Does not wait for requests already in flight. They complete on their
     * own threads and their results are dropped.
     */
    void shutdown();

   private:
    // Everything a dispatch needs, shared with request threads that may outlive the debouncer
    struct DispatchContext {
        std::shared_ptr<DirectionState> state;
        std::shared_ptr<TranslationBackend> backend;
        ResultCallback callback;
        std::mutex deliveryMutex;  // serializes check-and-deliver
        bool closed = false;       // guarded by deliveryMutex
    };

    static void dispatch(const std::shared_ptr<DispatchContext>& context, const std::string& text);

    void timerLoop();

    std::shared_ptr<DirectionState> state_;
    std::shared_ptr<DispatchContext> context_;
    std::chrono::milliseconds debounce_;

    // Guarded by state_->mutex
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool shutdown_ = false;

    std::condition_variable timerCv_;
    std::thread timerThread_;
};

}  // namespace translation
}  // namespace rtsub
