#include "save_debouncer.h"
#include "timer_queue.h"
#include "logger.h"

#include <stdexcept>

SaveDebouncer::SaveDebouncer(const std::shared_ptr<TimerQueue>& timers,
                             std::chrono::milliseconds window, WriteFn write)
    : state_(std::make_shared<State>())
    , timers_(timers)
    , window_(window)
{
    if (!timers) {
        throw std::invalid_argument("SaveDebouncer requires a TimerQueue");
    }
    if (!write) {
        throw std::invalid_argument("SaveDebouncer requires a write function");
    }
    state_->write = std::move(write);
}

void SaveDebouncer::requestSave() {
    auto timers = timers_.lock();
    if (!timers) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            state_->pending = 0;
        }
        Logger::instance().debug("Timer queue gone, saving without debounce");
        state_->write();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->pending > 0) {
            // Window already armed; the timer picks this up.
            ++state_->pending;
            return;
        }
        state_->pending = 1;
    }

    state_->write();

    std::weak_ptr<State> weak_state = state_;
    timers->scheduleAfter(window_, [weak_state] { onTimer(weak_state); });
}

int SaveDebouncer::pendingCount() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->pending;
}

void SaveDebouncer::onTimer(const std::weak_ptr<State>& weak_state) {
    auto state = weak_state.lock();
    if (!state) {
        return;
    }

    bool run = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        run = state->pending > 1;
        state->pending = 0;
    }
    if (run) {
        state->write();
    }
}
