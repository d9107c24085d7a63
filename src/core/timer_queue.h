// timer_queue.h
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/// Runs delayed callbacks on one dedicated worker thread, in deadline order.
/// Callbacks never run concurrently with each other. Callbacks still pending
/// at destruction are dropped.
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;

    TimerQueue();
    ~TimerQueue();

    // Non-copyable
    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// Run `callback` on the worker thread once `delay` has elapsed.
    /// Callbacks with equal deadlines run in scheduling order.
    void scheduleAfter(std::chrono::milliseconds delay, std::function<void()> callback);

    /// Number of callbacks waiting for their deadline.
    size_t pending() const;

    /// True when called from the worker thread.
    bool isWorkerThread() const;

private:
    struct Entry {
        Clock::time_point deadline;
        uint64_t sequence;
        std::function<void()> callback;
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.deadline != b.deadline) {
                return a.deadline > b.deadline;
            }
            return a.sequence > b.sequence;
        }
    };

    void run();

    std::priority_queue<Entry, std::vector<Entry>, Later> entries_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_sequence_ = 0;
    bool stopped_ = false;
    std::thread worker_;
};
