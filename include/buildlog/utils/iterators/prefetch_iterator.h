#ifndef BUILDLOG_UTILS_ITERATORS_PREFETCH_ITERATOR_H
#define BUILDLOG_UTILS_ITERATORS_PREFETCH_ITERATOR_H

#include <buildlog/utils/common/cancellation_token.h>
#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/iterators/iterator.h>
#include <buildlog/utils/reader/error.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

namespace buildlog::utils {

/**
 * Runs a base iterator on a background thread and buffers its items in a
 * bounded queue. Items are delivered in the base iterator's order.
 *
 * The queue holds max(2 * prefetch_size, 100) items and the producer pulls
 * min(50, prefetch_size) items per batch. Both sides wait with a timeout
 * that the producer recalibrates about once per second from the number of
 * full and empty waits it observed. End of data is a single sentinel; an
 * exception thrown by the base iterator reaches the consumer right after
 * it.
 *
 * The base iterator is only touched by the background thread while it runs.
 */
template <typename T>
class PrefetchIterator : public Iterator<T> {
   public:
    explicit PrefetchIterator(
        Iterator<T> &base,
        std::size_t prefetch_size = constants::iterators::DEFAULT_PREFETCH_SIZE,
        double timeout_seconds = constants::iterators::DEFAULT_PREFETCH_TIMEOUT)
        : base_(base),
          prefetch_size_(std::max<std::size_t>(prefetch_size, 1)),
          capacity_(std::max(2 * prefetch_size_,
                             constants::iterators::MIN_PREFETCH_QUEUE_SIZE)),
          batch_size_(std::min(constants::iterators::MAX_PREFETCH_BATCH_SIZE,
                               prefetch_size_)),
          timeout_(clamp_timeout(timeout_seconds)),
          finished_(false),
          closed_(false),
          worker_running_(false),
          close_base_on_exit_(false),
          full_events_(0),
          empty_events_(0) {
        start();
    }

    ~PrefetchIterator() override { stop(); }

    PrefetchIterator(const PrefetchIterator &) = delete;
    PrefetchIterator &operator=(const PrefetchIterator &) = delete;

    bool next(T &item) override {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            if (finished_ || closed_) {
                return false;
            }
            if (!queue_.empty()) {
                return take_front(lock, item);
            }
            ++empty_events_;
            not_empty_.wait_for(lock, timeout_, [this] {
                return !queue_.empty() || closed_;
            });
        }
    }

    /**
     * Like next() but gives up after the given wait
     * @throws ReaderError TIMEOUT if no item arrived in time
     */
    template <typename Rep, typename Period>
    bool next_for(T &item, const std::chrono::duration<Rep, Period> &wait) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (finished_ || closed_) {
            return false;
        }
        if (!not_empty_.wait_for(lock, wait, [this] {
                return !queue_.empty() || closed_;
            })) {
            ++empty_events_;
            throw ReaderError(ReaderError::TIMEOUT,
                              "No prefetched item available within the wait");
        }
        if (closed_) {
            return false;
        }
        return take_front(lock, item);
    }

    /**
     * Stop the producer without waiting for it and close the base iterator.
     * If the producer is in the middle of a pull, it closes the base
     * iterator itself on exit.
     */
    void close() override {
        token_.cancel();
        bool close_now;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            close_now = !worker_running_;
            if (!close_now) {
                close_base_on_exit_ = true;
            }
        }
        not_empty_.notify_all();
        not_full_.notify_all();
        if (close_now) {
            base_.close();
        }
    }

    void reset() override {
        stop();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.clear();
            error_ = nullptr;
            finished_ = false;
            closed_ = false;
            close_base_on_exit_ = false;
            full_events_ = 0;
            empty_events_ = 0;
        }
        token_.reset();
        try {
            base_.reset();
        } catch (...) {
            // No producer runs until the next successful reset
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
            throw;
        }
        start();
    }

    std::size_t capacity() const { return capacity_; }
    std::size_t batch_size() const { return batch_size_; }

    double timeout_seconds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::duration<double>(timeout_).count();
    }

   private:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double>;

    static Duration clamp_timeout(double seconds) {
        return Duration(
            std::min(std::max(seconds,
                              constants::iterators::MIN_PREFETCH_TIMEOUT),
                     constants::iterators::MAX_PREFETCH_TIMEOUT));
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        worker_running_ = true;
        last_adjustment_ = Clock::now();
        worker_ = std::thread(&PrefetchIterator::run, this);
    }

    void stop() {
        token_.cancel();
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        not_full_.notify_all();
        not_empty_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    bool take_front(std::unique_lock<std::mutex> &lock, T &item) {
        std::optional<T> front = std::move(queue_.front());
        queue_.pop_front();
        if (!front) {
            finished_ = true;
            std::exception_ptr error = error_;
            error_ = nullptr;
            lock.unlock();
            if (error) {
                std::rethrow_exception(error);
            }
            return false;
        }
        lock.unlock();
        not_full_.notify_one();
        item = std::move(*front);
        return true;
    }

    // Caller holds mutex_
    void maybe_adjust_timeout() {
        auto now = Clock::now();
        if (now - last_adjustment_ < std::chrono::seconds(1)) {
            return;
        }
        double usage = static_cast<double>(queue_.size()) /
                       static_cast<double>(capacity_);
        double seconds = timeout_.count();
        if (usage > 0.8 && full_events_ > 0) {
            seconds *= 1.2;
        } else if (usage < 0.2 && empty_events_ > 0) {
            seconds *= 0.8;
        }
        timeout_ = clamp_timeout(seconds);
        BUILDLOG_UTILS_LOG_TRACE(
            "Prefetch usage %.2f, full %zu, empty %zu, timeout %.4fs", usage,
            full_events_, empty_events_, timeout_.count());
        full_events_ = 0;
        empty_events_ = 0;
        last_adjustment_ = now;
    }

    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (queue_.size() >= capacity_) {
            if (token_.is_cancelled()) {
                return false;
            }
            ++full_events_;
            not_full_.wait_for(lock, timeout_, [this] {
                return queue_.size() < capacity_ || token_.is_cancelled();
            });
            maybe_adjust_timeout();
        }
        if (token_.is_cancelled()) {
            return false;
        }
        queue_.emplace_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    void run() {
        bool exhausted = false;
        while (!exhausted && !token_.is_cancelled()) {
            std::size_t batch = batch_size_;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                maybe_adjust_timeout();
                std::size_t free_slots =
                    capacity_ > queue_.size() ? capacity_ - queue_.size() : 0;
                if (free_slots * 2 < batch_size_) {
                    batch = std::max<std::size_t>(1, batch_size_ / 4);
                }
            }

            std::vector<T> items;
            items.reserve(batch);
            std::exception_ptr failure;
            try {
                for (std::size_t i = 0; i < batch; ++i) {
                    T item;
                    if (!base_.next(item)) {
                        exhausted = true;
                        break;
                    }
                    items.push_back(std::move(item));
                }
            } catch (...) {
                // Handed to the consumer after the sentinel
                failure = std::current_exception();
                exhausted = true;
            }

            for (auto &item : items) {
                if (!push(std::move(item))) {
                    break;
                }
            }
            if (failure) {
                std::lock_guard<std::mutex> lock(mutex_);
                error_ = failure;
            }
        }

        bool close_base;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace_back(std::nullopt);
            worker_running_ = false;
            close_base = close_base_on_exit_;
            close_base_on_exit_ = false;
        }
        not_empty_.notify_all();
        if (close_base) {
            base_.close();
        }
    }

    Iterator<T> &base_;
    const std::size_t prefetch_size_;
    const std::size_t capacity_;
    const std::size_t batch_size_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<std::optional<T>> queue_;
    Duration timeout_;
    std::exception_ptr error_;
    bool finished_;
    bool closed_;
    bool worker_running_;
    bool close_base_on_exit_;
    std::size_t full_events_;
    std::size_t empty_events_;
    Clock::time_point last_adjustment_;

    CancellationToken token_;
    std::thread worker_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_ITERATORS_PREFETCH_ITERATOR_H
