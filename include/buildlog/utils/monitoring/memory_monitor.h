#ifndef BUILDLOG_UTILS_MONITORING_MEMORY_MONITOR_H
#define BUILDLOG_UTILS_MONITORING_MEMORY_MONITOR_H

#include <buildlog/utils/common/constants.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace buildlog::utils {

struct MemorySnapshot {
    std::chrono::system_clock::time_point timestamp;
    std::uint64_t total_bytes = 0;
    // Resident set size of this process
    std::uint64_t used_bytes = 0;
    // used_bytes / total_bytes
    double usage = 0.0;

    double used_mb() const {
        return static_cast<double>(used_bytes) / (1024.0 * 1024.0);
    }
};

/**
 * Resident set size of the calling process, from /proc/self/statm
 * @throws ReaderError READ_ERROR if it cannot be read
 */
std::uint64_t process_rss_bytes();

// Physical memory installed, in bytes
std::uint64_t physical_memory_bytes();

/**
 * Samples the process RSS every sampling_interval seconds on a background
 * thread and keeps the latest MAX_MEMORY_SNAPSHOTS samples.
 */
class MemoryMonitor {
   public:
    /**
     * @throws ReaderError VALIDATION_ERROR unless 0 < threshold <= 1 and
     * sampling_interval > 0
     */
    explicit MemoryMonitor(
        double threshold = constants::monitoring::DEFAULT_MEMORY_THRESHOLD,
        double sampling_interval =
            constants::monitoring::DEFAULT_SAMPLING_INTERVAL);
    ~MemoryMonitor();

    MemoryMonitor(const MemoryMonitor &) = delete;
    MemoryMonitor &operator=(const MemoryMonitor &) = delete;

    void start_monitoring();
    void stop_monitoring();
    bool is_monitoring() const;

    // Sample now and append to the history
    MemorySnapshot take_snapshot();

    // Current RSS as a fraction of physical memory
    double check_memory_usage() const;
    bool above_threshold() const;

    std::vector<MemorySnapshot> memory_trend() const;

    /**
     * True when RSS grew by more than LEAK_GROWTH_RATE across the last
     * window_size samples; false while fewer samples exist
     */
    bool detect_memory_leak(
        std::size_t window_size =
            constants::monitoring::DEFAULT_LEAK_WINDOW) const;

    double threshold() const { return threshold_; }
    double sampling_interval() const { return sampling_interval_; }

   private:
    void run();

    const double threshold_;
    const double sampling_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool monitoring_;
    std::thread thread_;
    std::deque<MemorySnapshot> snapshots_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_MONITORING_MEMORY_MONITOR_H
