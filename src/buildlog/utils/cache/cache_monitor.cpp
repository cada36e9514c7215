#include <buildlog/utils/cache/cache_monitor.h>

namespace buildlog::utils::cache {

const char *cache_operation_name(CacheOperation operation) {
    switch (operation) {
        case CacheOperation::Get:
            return "get";
        case CacheOperation::Put:
            return "put";
        case CacheOperation::Remove:
            return "remove";
    }
    return "unknown";
}

void CacheMonitor::record_operation(CacheOperation operation,
                                    double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.total_operations;
    if (operation == CacheOperation::Get) {
        ++stats_.get_operations;
        stats_.total_get_time += seconds;
    }
}

void CacheMonitor::update_rates(std::size_t hits, std::size_t misses,
                                std::size_t evictions) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t lookups = hits + misses;
    if (lookups > 0) {
        stats_.hit_rate =
            static_cast<double>(hits) / static_cast<double>(lookups);
        stats_.miss_rate =
            static_cast<double>(misses) / static_cast<double>(lookups);
    }
    if (stats_.total_operations > 0) {
        stats_.eviction_rate = static_cast<double>(evictions) /
                               static_cast<double>(stats_.total_operations);
    }
}

CacheMonitor::Stats CacheMonitor::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void CacheMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = Stats();
}

}  // namespace buildlog::utils::cache
