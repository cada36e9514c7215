#include <buildlog/utils/monitoring/stats_collector.h>

#include <algorithm>

namespace buildlog::utils {

StatsCollector::StatsCollector() : start_time_(Clock::now()) {}

void StatsCollector::collect_io_stats(std::uint64_t bytes_read,
                                      double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    io_.bytes_read_total += bytes_read;
    io_.read_operations += 1;
    io_.total_time += seconds;
}

void StatsCollector::record_cache_hit() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cache_.hits;
}

void StatsCollector::record_cache_miss() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++cache_.misses;
}

void StatsCollector::collect_operation_latency(const std::string &operation,
                                               double latency) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_locked(operation, latency);
}

void StatsCollector::record_metric(const std::string &name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_locked(name, value);
}

void StatsCollector::record_locked(const std::string &name, double value) {
    OperationStats &stats = operations_[name];
    if (stats.count == 0) {
        stats.min = value;
        stats.max = value;
    } else {
        stats.min = std::min(stats.min, value);
        stats.max = std::max(stats.max, value);
    }
    stats.total += value;
    ++stats.count;
}

StatsCollector::Snapshot StatsCollector::get_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot snapshot;
    snapshot.io = io_;
    double elapsed =
        std::chrono::duration<double>(Clock::now() - start_time_).count();
    if (elapsed > 0.0) {
        snapshot.io.read_speed_mbps =
            (static_cast<double>(io_.bytes_read_total) / (1024.0 * 1024.0)) /
            elapsed;
    }
    snapshot.cache = cache_;
    snapshot.operations = operations_;
    return snapshot;
}

void StatsCollector::reset_statistics() {
    std::lock_guard<std::mutex> lock(mutex_);
    start_time_ = Clock::now();
    io_ = IOStats();
    cache_ = LookupStats();
    operations_.clear();
}

}  // namespace buildlog::utils
