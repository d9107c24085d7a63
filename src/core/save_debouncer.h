#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

class TimerQueue;

/// Trailing, coalesced save scheduling.
///
///  - Idle (count == 0): requestSave() sets count = 1, writes immediately and
///    arms a timer for `window`.
///  - Armed (count >= 1): requestSave() only increments count.
///  - Timer: if count > 1 one more write captures the latest state; count
///    goes back to 0 either way.
///
/// At most one immediate write plus one trailing write per window. An armed
/// timer is never cancelled; it holds only a weak reference to the
/// debouncer, so firing after the owner is gone does nothing.
///
/// The TimerQueue is referenced weakly too. Once it is gone every
/// requestSave() writes through immediately and nothing is armed.
class SaveDebouncer {
public:
    using WriteFn = std::function<void()>;

    /// @throws std::invalid_argument if `timers` is null or `write` is empty.
    SaveDebouncer(const std::shared_ptr<TimerQueue>& timers,
                  std::chrono::milliseconds window, WriteFn write);

    SaveDebouncer(const SaveDebouncer&) = delete;
    SaveDebouncer& operator=(const SaveDebouncer&) = delete;

    /// Request that the current state be persisted.
    void requestSave();

    /// Saves requested since the window was armed (0 when idle).
    int pendingCount() const;

    std::chrono::milliseconds window() const { return window_; }

private:
    struct State {
        std::mutex mutex;
        int pending = 0;
        WriteFn write;
    };

    static void onTimer(const std::weak_ptr<State>& weak_state);

    std::shared_ptr<State> state_;
    std::weak_ptr<TimerQueue> timers_;
    std::chrono::milliseconds window_;
};
