#ifndef TOKENFLOW_MODULES_SCHEDULER_COMPLETION_CHANNEL_H
#define TOKENFLOW_MODULES_SCHEDULER_COMPLETION_CHANNEL_H

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>

namespace tokenflow {

// Many producers (workers), one consumer (scheduler loop)
template <typename T>
class CompletionChannel {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
    }

    // Wakes up on a push, a notify() or the timeout
    std::optional<T> pop_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || woken_; });
        woken_ = false;
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out(std::make_move_iterator(items_.begin()), std::make_move_iterator(items_.end()));
        items_.clear();
        return out;
    }

    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            woken_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool woken_ = false;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_SCHEDULER_COMPLETION_CHANNEL_H
