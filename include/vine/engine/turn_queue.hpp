#pragma once

#include "../types.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace vine {
namespace engine {

/**
 * @brief Thread-safe MPSC queue of user turns
 *
 * Multiple producers (threads calling Client::chat), one consumer (the
 * client's worker thread), so turns run strictly one at a time in
 * submission order.
 */
class TurnQueue {
public:
    /// @param max_size Maximum queue size (0 = unlimited)
    explicit TurnQueue(size_t max_size = 0)
        : max_size_(max_size) {}

    /**
     * @brief Enqueue a turn (non-blocking)
     *
     * @return false if the queue is full or shut down
     */
    bool push(TurnRequest request) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) {
            return false;
        }
        if (max_size_ > 0 && queue_.size() >= max_size_) {
            return false;
        }
        queue_.push_back(std::move(request));
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until a turn is available or shutdown is signaled
     *
     * Pending turns are still handed out after shutdown; nullopt means
     * shut down and drained.
     */
    std::optional<TurnRequest> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || shutdown_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        TurnRequest req = std::move(queue_.front());
        queue_.pop_front();
        return req;
    }

    /// Remove and return every pending turn so the caller can settle their promises.
    std::vector<TurnRequest> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<TurnRequest> pending;
        pending.reserve(queue_.size());
        for (auto& req : queue_) {
            pending.push_back(std::move(req));
        }
        queue_.clear();
        return pending;
    }

    /// Wakes blocked pop() calls and rejects further pushes.
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

private:
    std::deque<TurnRequest> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t max_size_;
    bool shutdown_ = false;
};

} // namespace engine
} // namespace vine
