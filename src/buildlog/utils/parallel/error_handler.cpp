#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/parallel/error_handler.h>

#include <algorithm>
#include <cmath>

namespace buildlog::utils {

ErrorHandler::ErrorHandler(std::size_t max_retries, double retry_delay)
    : max_retries_(max_retries), base_retry_delay_(retry_delay) {
    if (retry_delay < 0.0) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Retry delay must not be negative");
    }
}

void ErrorHandler::register_recovery_handler(ReaderError::Type kind,
                                             RecoveryHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    recovery_handlers_[kind] = std::move(handler);
}

bool ErrorHandler::handle_error(ReaderError::Type kind,
                                const std::string &message,
                                const std::string &task_id,
                                const Metadata &metadata, bool allow_retry) {
    std::size_t current_count;
    ErrorContext context;
    RecoveryHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_count = ++error_counts_[task_id];

        context.error_kind = kind;
        context.message = message;
        context.task_id = task_id;
        context.retry_count = current_count - 1;
        context.timestamp = std::chrono::system_clock::now();
        context.metadata = metadata;
        error_contexts_[task_id] = context;

        auto it = recovery_handlers_.find(kind);
        if (it != recovery_handlers_.end()) {
            handler = it->second;
        }
    }

    if (handler) {
        try {
            handler(context);
        } catch (const std::exception &e) {
            BUILDLOG_UTILS_LOG_ERROR("Recovery handler for %s failed: %s",
                                     ReaderError::type_name(kind), e.what());
        }
    }

    if (!allow_retry || current_count > max_retries_) {
        BUILDLOG_UTILS_LOG_WARN("Task %s failed permanently after %zu attempts",
                                task_id.c_str(), current_count);
        return false;
    }

    double delay = retry_delay(current_count);
    BUILDLOG_UTILS_LOG_INFO(
        "Task %s will be retried in %.2fs (attempt %zu/%zu)", task_id.c_str(),
        delay, current_count, max_retries_);
    if (token_.wait_for(std::chrono::duration<double>(delay))) {
        BUILDLOG_UTILS_LOG_DEBUG("Retry of task %s cancelled", task_id.c_str());
        return false;
    }
    return true;
}

void ErrorHandler::clear_error(const std::string &task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_counts_.erase(task_id);
    error_contexts_.erase(task_id);
}

void ErrorHandler::clear_all_errors() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_counts_.clear();
    error_contexts_.clear();
}

std::optional<ErrorContext> ErrorHandler::error_context(
    const std::string &task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_contexts_.find(task_id);
    if (it == error_contexts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ErrorHandler::error_count(const std::string &task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(task_id);
    return it == error_counts_.end() ? 0 : it->second;
}

double ErrorHandler::retry_delay(std::size_t count) const {
    if (count == 0) {
        return 0.0;
    }
    double delay =
        base_retry_delay_ * std::pow(2.0, static_cast<double>(count - 1));
    return std::min(delay, constants::parallel::MAX_RETRY_DELAY);
}

void ErrorHandler::cancel() { token_.cancel(); }

void ErrorHandler::resume() { token_.reset(); }

}  // namespace buildlog::utils
