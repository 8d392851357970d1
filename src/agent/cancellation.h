#pragma once

#include "status.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ua {

// Job-level stop signal shared by the CLI, the worker pool and the upload
// coordinator. The first cancel() wins and fixes the reason.
class CancellationToken {
public:
    void cancel(ErrorCode reason = ErrorCode::Cancelled) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (cancelled_) return;
            reason_ = reason;
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool isCancelled() const { return cancelled_; }

    ErrorCode reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reason_;
    }

    // Sleeps for up to delay. Returns false if cancelled before or during the wait.
    bool sleepFor(std::chrono::milliseconds delay) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return !cv_.wait_for(lock, delay, [this] { return cancelled_.load(); });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
    ErrorCode reason_ = ErrorCode::Ok;
};

} // namespace ua
