#ifndef BUILDLOG_UTILS_PARALLEL_ERROR_HANDLER_H
#define BUILDLOG_UTILS_PARALLEL_ERROR_HANDLER_H

#include <buildlog/utils/common/cancellation_token.h>
#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/typedefs.h>
#include <buildlog/utils/reader/error.h>

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace buildlog::utils {

struct ErrorContext {
    ReaderError::Type error_kind = ReaderError::READ_ERROR;
    std::string message;
    std::string task_id;
    // Failures before this one
    std::size_t retry_count = 0;
    std::chrono::system_clock::time_point timestamp;
    Metadata metadata;
};

using RecoveryHandler = std::function<void(const ErrorContext &)>;

/**
 * Per-task retry policy with exponential backoff.
 *
 * Each failure of a task increments its counter and replaces its context.
 * The task is retried while the counter is at most max_retries, after
 * sleeping min(retry_delay * 2^(count - 1), MAX_RETRY_DELAY) seconds. The
 * sleep ends early when cancel() is called, and the task is then not
 * retried.
 */
class ErrorHandler {
   public:
    ErrorHandler(
        std::size_t max_retries = constants::parallel::DEFAULT_MAX_RETRIES,
        double retry_delay = constants::parallel::DEFAULT_RETRY_DELAY);

    ErrorHandler(const ErrorHandler &) = delete;
    ErrorHandler &operator=(const ErrorHandler &) = delete;

    // Replaces any handler already registered for the kind
    void register_recovery_handler(ReaderError::Type kind,
                                   RecoveryHandler handler);

    /**
     * Record a failure and decide whether to retry the task
     * @param allow_retry false when the caller has already vetoed a retry;
     * the failure is still recorded and the handler still runs
     * @return true if the task should be attempted again
     */
    bool handle_error(ReaderError::Type kind, const std::string &message,
                      const std::string &task_id,
                      const Metadata &metadata = Metadata(),
                      bool allow_retry = true);

    void clear_error(const std::string &task_id);
    // Forget the counters and contexts of every task
    void clear_all_errors();
    std::optional<ErrorContext> error_context(const std::string &task_id) const;
    std::size_t error_count(const std::string &task_id) const;

    // Backoff in seconds before the retry that follows failure number count
    double retry_delay(std::size_t count) const;

    std::size_t max_retries() const { return max_retries_; }

    // Wake any backoff sleep and refuse further retries
    void cancel();
    void resume();

   private:
    const std::size_t max_retries_;
    const double base_retry_delay_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> error_counts_;
    std::unordered_map<std::string, ErrorContext> error_contexts_;
    std::map<ReaderError::Type, RecoveryHandler> recovery_handlers_;

    CancellationToken token_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_PARALLEL_ERROR_HANDLER_H
