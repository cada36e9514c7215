#ifndef BUILDLOG_UTILS_CACHE_CACHE_MANAGER_H
#define BUILDLOG_UTILS_CACHE_CACHE_MANAGER_H

#include <buildlog/utils/cache/cache_monitor.h>
#include <buildlog/utils/cache/cache_strategy.h>
#include <buildlog/utils/cache/size_of.h>
#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/reader/error.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace buildlog::utils::cache {

struct CacheStats {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t evictions = 0;
    std::size_t entries = 0;
    std::size_t current_size = 0;
    std::size_t max_size = 0;

    double hit_rate() const {
        std::size_t total = hits + misses;
        return total == 0 ? 0.0
                          : static_cast<double>(hits) /
                                static_cast<double>(total);
    }
};

/**
 * Byte-budgeted cache over a CacheStrategy.
 *
 * put() evicts through the strategy until the new value fits. A value
 * larger than the whole budget is not cached. All operations take one
 * mutex, and the eviction loop runs under a single acquisition. get, put
 * and remove report their duration to a CacheMonitor.
 */
template <typename V>
class CacheManager {
   public:
    explicit CacheManager(
        std::unique_ptr<CacheStrategy<V>> strategy,
        std::size_t max_size = constants::cache::DEFAULT_CACHE_SIZE)
        : strategy_(std::move(strategy)), max_size_(max_size) {
        if (!strategy_) {
            throw ReaderError(ReaderError::VALIDATION_ERROR,
                              "Cache strategy must not be null");
        }
        if (max_size_ == 0) {
            throw ReaderError(ReaderError::VALIDATION_ERROR,
                              "Cache size must be positive");
        }
    }

    CacheManager(const CacheManager &) = delete;
    CacheManager &operator=(const CacheManager &) = delete;

    bool has(const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return strategy_->contains(key);
    }

    std::optional<V> get(const std::string &key) {
        auto start = Clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<V> value = strategy_->get(key);
        if (value) {
            ++stats_.hits;
        }
        monitor_.record_operation(CacheOperation::Get, seconds_since(start));
        return value;
    }

    /**
     * @return true if the value was stored
     */
    bool put(const std::string &key, V value) {
        auto start = Clock::now();
        std::size_t size = size_of(value);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!strategy_->contains(key)) {
            ++stats_.misses;
        } else {
            strategy_->remove(key);
        }

        while (strategy_->get_bytes() + size > max_size_ &&
               strategy_->get_size() > 0) {
            if (!strategy_->evict_one()) {
                break;
            }
            ++stats_.evictions;
        }

        if (strategy_->get_bytes() + size > max_size_) {
            BUILDLOG_UTILS_LOG_DEBUG(
                "Value for '%s' (%zu bytes) exceeds cache budget %zu, not "
                "cached",
                key.c_str(), size, max_size_);
            monitor_.record_operation(CacheOperation::Put,
                                      seconds_since(start));
            return false;
        }
        strategy_->put(key, std::move(value), size);
        monitor_.record_operation(CacheOperation::Put, seconds_since(start));
        return true;
    }

    bool remove(const std::string &key) {
        auto start = Clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        bool removed = strategy_->remove(key);
        monitor_.record_operation(CacheOperation::Remove,
                                  seconds_since(start));
        return removed;
    }

    // Drops all entries and resets the counters
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        strategy_->clear();
        stats_ = CacheStats();
        monitor_.reset();
    }

    /**
     * Change the budget, evicting until the cache fits the new size
     * @throws ReaderError VALIDATION_ERROR if max_size <= 0
     */
    void set_max_size(std::int64_t max_size) {
        if (max_size <= 0) {
            throw ReaderError(ReaderError::VALIDATION_ERROR,
                              "Cache size must be positive, got " +
                                  std::to_string(max_size));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        max_size_ = static_cast<std::size_t>(max_size);
        while (strategy_->get_bytes() > max_size_) {
            if (!strategy_->evict_one()) {
                break;
            }
            ++stats_.evictions;
        }
    }

    std::size_t max_size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_size_;
    }

    std::size_t current_size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return strategy_->get_bytes();
    }

    std::vector<std::string> keys() {
        std::lock_guard<std::mutex> lock(mutex_);
        return strategy_->keys();
    }

    CacheStats stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats snapshot = stats_;
        snapshot.entries = strategy_->get_size();
        snapshot.current_size = strategy_->get_bytes();
        snapshot.max_size = max_size_;
        return snapshot;
    }

    // Operation latency with rates taken from the current counters
    CacheMonitor::Stats monitor_stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor_.update_rates(stats_.hits, stats_.misses, stats_.evictions);
        return monitor_.stats();
    }

   private:
    using Clock = std::chrono::steady_clock;

    static double seconds_since(Clock::time_point start) {
        return std::chrono::duration<double>(Clock::now() - start).count();
    }

    mutable std::mutex mutex_;
    std::unique_ptr<CacheStrategy<V>> strategy_;
    std::size_t max_size_;
    CacheStats stats_;
    CacheMonitor monitor_;
};

}  // namespace buildlog::utils::cache

#endif  // BUILDLOG_UTILS_CACHE_CACHE_MANAGER_H
