#ifndef BUILDLOG_UTILS_COMMON_CANCELLATION_TOKEN_H
#define BUILDLOG_UTILS_COMMON_CANCELLATION_TOKEN_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace buildlog::utils {

/**
 * One-shot stop signal shared between a controller and background work.
 * Waiters block on the token itself, so cancel() wakes them immediately.
 */
class CancellationToken {
   public:
    CancellationToken() : cancelled_(false) {}
    CancellationToken(const CancellationToken &) = delete;
    CancellationToken &operator=(const CancellationToken &) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cond_.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    // Re-arm after the owner has joined everything that observed it
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = false;
    }

    /**
     * Sleep for up to the given duration
     * @return true if the token was cancelled before the duration elapsed
     */
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period> &duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cond_.wait_for(lock, duration, [this] { return cancelled_; });
    }

   private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cond_;
    bool cancelled_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_COMMON_CANCELLATION_TOKEN_H
