#include "translation/translation_debouncer.h"

#include "core/errors.h"
#include "logging/logger.h"

#include <system_error>

namespace rtsub {
namespace translation {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

bool endsWithSentenceTerminal(const std::string& text) {
    static const char* const kTerminals[] = {".", "?", "!", "。", "？", "！"};
    for (const char* terminal : kTerminals) {
        if (endsWith(text, terminal)) {
            return true;
        }
    }
    return false;
}

TranslationDebouncer::TranslationDebouncer(std::shared_ptr<DirectionState> state,
                                           std::shared_ptr<TranslationBackend> backend,
                                           ResultCallback callback,
                                           std::chrono::milliseconds debounce)
    : state_(std::move(state)),
      context_(std::make_shared<DispatchContext>()),
      debounce_(debounce) {
    context_->state = state_;
    context_->backend = std::move(backend);
    context_->callback = std::move(callback);
    timerThread_ = std::thread(&TranslationDebouncer::timerLoop, this);
}

TranslationDebouncer::~TranslationDebouncer() {
    shutdown();
}

void TranslationDebouncer::update(const std::string& text) {
    bool immediate = false;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (shutdown_ || text == state_->pendingText) {
            return;
        }
        state_->pendingText = text;
        if (endsWithSentenceTerminal(text)) {
            deadline_.reset();
            immediate = true;
        } else {
            deadline_ = std::chrono::steady_clock::now() + debounce_;
        }
    }
    timerCv_.notify_all();

    if (immediate) {
        dispatch(context_, text);
    }
}

void TranslationDebouncer::translateNow(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (shutdown_) {
            return;
        }
    }
    dispatch(context_, text);
}

void TranslationDebouncer::dispatch(const std::shared_ptr<DispatchContext>& context,
                                    const std::string& text) {
    DirectionState& state = *context->state;
    uint64_t mySequence = 0;
    languages::Direction direction;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (text.empty() || text == state.lastTranslated) {
            return;
        }
        state.lastTranslated = text;
        mySequence = ++state.sequence;
        direction = state.direction;
    }

    TranslationOutput output;
    try {
        output = context->backend->translate(text, direction);
    } catch (const RemoteServiceError& e) {
        LOG_WARN("[Translate] Request #{} failed ({}): {}", mySequence,
                 remoteErrorKindToString(e.kind()), e.what());
        return;
    } catch (const std::exception& e) {
        LOG_WARN("[Translate] Request #{} failed: {}", mySequence, e.what());
        return;
    }

    std::lock_guard<std::mutex> delivery(context->deliveryMutex);
    if (context->closed) {
        LOG_DEBUG("[Translate] Result #{} arrived after shutdown, dropped", mySequence);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (mySequence != state.sequence) {
            LOG_DEBUG("[Translate] Stale result #{} (current #{}), discarded", mySequence,
                      state.sequence);
            return;
        }
    }
    if (context->callback) {
        TranslationResult result;
        result.sequence = mySequence;
        result.direction = direction;
        result.source = text;
        result.corrected = std::move(output.corrected);
        result.translated = std::move(output.translated);
        context->callback(result);
    }
}

languages::Direction TranslationDebouncer::toggle() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->direction = languages::swapDirection(state_->direction);
    state_->lastTranslated.clear();
    return state_->direction;
}

void TranslationDebouncer::setDirection(const languages::Direction& direction) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->direction = direction;
    state_->lastTranslated.clear();
}

languages::Direction TranslationDebouncer::direction() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->direction;
}

bool TranslationDebouncer::timerArmed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return deadline_.has_value();
}

void TranslationDebouncer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        shutdown_ = true;
        deadline_.reset();
    }
    timerCv_.notify_all();
    if (timerThread_.joinable() && timerThread_.get_id() != std::this_thread::get_id()) {
        timerThread_.join();
    }
    // Waits for a delivery in progress, never for a request in flight
    std::lock_guard<std::mutex> delivery(context_->deliveryMutex);
    context_->closed = true;
}

void TranslationDebouncer::timerLoop() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (!shutdown_) {
        if (!deadline_) {
            timerCv_.wait(lock);
            continue;
        }
        auto deadline = *deadline_;
        if (std::chrono::steady_clock::now() < deadline) {
            timerCv_.wait_until(lock, deadline);
            continue;
        }
        deadline_.reset();
        std::string text = state_->pendingText;
        lock.unlock();
        try {
            std::thread([context = context_, text]() { dispatch(context, text); }).detach();
        } catch (const std::system_error& e) {
            LOG_ERROR("[Translate] Cannot start request thread: {}", e.what());
        }
        lock.lock();
    }
}

}  // namespace translation
}  // namespace rtsub
