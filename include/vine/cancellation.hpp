#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace vine {

/**
 * @brief Cooperative interrupt shared by everything a turn may block on
 *
 * cancel() flips the flag once and runs every registered callback on the
 * cancelling thread. Blocking components register a callback that wakes
 * them (ProcessSession registers its own stop()); loops poll
 * is_cancelled() between steps.
 *
 * @threadsafety All methods are thread-safe. remove_callback() blocks
 *               while a concurrent cancel() is still running callbacks,
 *               so an owner may safely deregister in its destructor.
 */
class CancellationToken {
public:
    using CallbackId = uint64_t;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Idempotent; only the first call runs callbacks.
    void cancel() {
        std::vector<std::function<void()>> to_run;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            for (auto& [id, callback] : callbacks_) {
                to_run.push_back(std::move(callback));
            }
            callbacks_.clear();
            dispatching_ = true;
            dispatcher_ = std::this_thread::get_id();
        }

        for (auto& callback : to_run) {
            callback();
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            dispatching_ = false;
        }
        dispatch_done_.notify_all();
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Register a callback to run on cancel()
     *
     * If the token is already cancelled the callback runs immediately on
     * the calling thread and 0 is returned.
     */
    CallbackId on_cancel(std::function<void()> callback) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_.load(std::memory_order_acquire)) {
                CallbackId id = next_id_++;
                callbacks_.emplace(id, std::move(callback));
                return id;
            }
        }
        callback();
        return 0;
    }

    void remove_callback(CallbackId id) {
        std::unique_lock<std::mutex> lock(mutex_);
        callbacks_.erase(id);
        if (dispatcher_ != std::this_thread::get_id()) {
            dispatch_done_.wait(lock, [this] { return !dispatching_; });
        }
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable dispatch_done_;
    std::atomic<bool> cancelled_{false};
    bool dispatching_ = false;
    std::thread::id dispatcher_;
    std::map<CallbackId, std::function<void()>> callbacks_;
    CallbackId next_id_ = 1;
};

} // namespace vine
