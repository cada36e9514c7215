#ifndef BUILDLOG_UTILS_CACHE_CACHE_MONITOR_H
#define BUILDLOG_UTILS_CACHE_CACHE_MONITOR_H

#include <cstddef>
#include <mutex>

namespace buildlog::utils::cache {

enum class CacheOperation { Get, Put, Remove };

const char *cache_operation_name(CacheOperation operation);

/**
 * Operation counts and lookup latency of a cache, plus rates derived from
 * its hit, miss and eviction counters.
 */
class CacheMonitor {
   public:
    struct Stats {
        std::size_t total_operations = 0;
        std::size_t get_operations = 0;
        // Seconds spent in get
        double total_get_time = 0.0;
        double hit_rate = 0.0;
        double miss_rate = 0.0;
        // Evictions per recorded operation
        double eviction_rate = 0.0;

        double average_get_time() const {
            return get_operations == 0
                       ? 0.0
                       : total_get_time / static_cast<double>(get_operations);
        }
    };

    void record_operation(CacheOperation operation, double seconds);
    void update_rates(std::size_t hits, std::size_t misses,
                      std::size_t evictions);

    Stats stats() const;
    void reset();

   private:
    mutable std::mutex mutex_;
    Stats stats_;
};

}  // namespace buildlog::utils::cache

#endif  // BUILDLOG_UTILS_CACHE_CACHE_MONITOR_H
