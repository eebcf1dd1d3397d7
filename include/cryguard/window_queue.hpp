#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace cryguard {

enum class PopResult { ITEM, TIMEOUT, STOPPED };

// Thread-safe bounded queue between the score feed and the monitor loop.
template <typename T>
class WindowQueue {
public:
    explicit WindowQueue(size_t max_items = 8) : max_items_(max_items) {}

    // Blocks while full. Returns false once stopped.
    bool push(const T& item) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_full_.wait(lock, [&] { return queue_.size() < max_items_ || stopped_; });
        if (stopped_) return false;
        queue_.push(item);
        lock.unlock();
        cv_empty_.notify_one();
        return true;
    }

    PopResult pop_for(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_empty_.wait_for(lock, timeout, [&] { return !queue_.empty() || stopped_; })) {
            return PopResult::TIMEOUT;
        }
        if (queue_.empty()) return PopResult::STOPPED;
        out = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        cv_full_.notify_one();
        return PopResult::ITEM;
    }

    // Items already queued are still delivered after stop().
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

private:
    size_t max_items_;
    std::queue<T> queue_;
    std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool stopped_{false};
};

}  // namespace cryguard
