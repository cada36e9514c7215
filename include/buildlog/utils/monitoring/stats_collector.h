#ifndef BUILDLOG_UTILS_MONITORING_STATS_COLLECTOR_H
#define BUILDLOG_UTILS_MONITORING_STATS_COLLECTOR_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace buildlog::utils {

/**
 * Thread-safe counters for one reading session. Create one per session and
 * pass it to the components that should report into it.
 */
class StatsCollector {
   public:
    struct IOStats {
        std::uint64_t bytes_read_total = 0;
        std::size_t read_operations = 0;
        double total_time = 0.0;
        // Bytes per second since the collector was created or reset, in MiB
        double read_speed_mbps = 0.0;

        double avg_read_latency() const {
            return read_operations == 0
                       ? 0.0
                       : total_time / static_cast<double>(read_operations);
        }
    };

    struct LookupStats {
        std::size_t hits = 0;
        std::size_t misses = 0;

        double hit_ratio() const {
            std::size_t total = hits + misses;
            return total == 0 ? 0.0
                              : static_cast<double>(hits) /
                                    static_cast<double>(total);
        }
    };

    struct OperationStats {
        std::size_t count = 0;
        double total = 0.0;
        double min = 0.0;
        double max = 0.0;

        double average() const {
            return count == 0 ? 0.0 : total / static_cast<double>(count);
        }
    };

    struct Snapshot {
        IOStats io;
        LookupStats cache;
        std::map<std::string, OperationStats> operations;
    };

    StatsCollector();

    void collect_io_stats(std::uint64_t bytes_read, double seconds);
    void record_cache_hit();
    void record_cache_miss();

    // Latencies and custom metrics share one table keyed by name
    void collect_operation_latency(const std::string &operation,
                                   double latency);
    void record_metric(const std::string &name, double value);

    Snapshot get_statistics() const;
    void reset_statistics();

   private:
    using Clock = std::chrono::steady_clock;

    void record_locked(const std::string &name, double value);

    mutable std::mutex mutex_;
    Clock::time_point start_time_;
    IOStats io_;
    LookupStats cache_;
    std::map<std::string, OperationStats> operations_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_MONITORING_STATS_COLLECTOR_H
