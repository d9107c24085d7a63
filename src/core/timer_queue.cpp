// timer_queue.cpp
#include "timer_queue.h"
#include "logger.h"

#include <exception>

TimerQueue::TimerQueue()
    : worker_([this] { run(); })
{
}

TimerQueue::~TimerQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void TimerQueue::scheduleAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    if (!callback) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        entries_.push(Entry{Clock::now() + delay, next_sequence_++, std::move(callback)});
    }
    cv_.notify_one();
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool TimerQueue::isWorkerThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stopped_) {
            return;
        }
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return stopped_ || !entries_.empty(); });
            continue;
        }

        auto deadline = entries_.top().deadline;
        if (Clock::now() < deadline) {
            // Wakes early when an earlier deadline is scheduled or on stop.
            cv_.wait_until(lock, deadline);
            continue;
        }

        std::function<void()> callback = std::move(const_cast<Entry&>(entries_.top()).callback);
        entries_.pop();

        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            Logger::instance().error(std::string("Timer callback failed: ") + e.what());
        }
        lock.lock();
    }
}
