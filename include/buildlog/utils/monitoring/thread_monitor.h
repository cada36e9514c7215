#ifndef BUILDLOG_UTILS_MONITORING_THREAD_MONITOR_H
#define BUILDLOG_UTILS_MONITORING_THREAD_MONITOR_H

#include <buildlog/utils/common/typedefs.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace buildlog::utils {

/**
 * Task accounting per worker thread.
 *
 * A worker must be registered before its tasks are counted. Tasks are
 * identified by a string unique among those in flight; end_task() for a
 * task that was never started is ignored.
 */
class ThreadMonitor {
   public:
    struct ThreadStats {
        WorkerId thread_id = -1;
        std::size_t total_tasks = 0;
        std::size_t completed_tasks = 0;
        std::size_t failed_tasks = 0;
        // Mean duration of finished tasks, in seconds
        double avg_task_time = 0.0;
        double uptime_seconds = 0.0;

        double success_rate() const {
            return total_tasks == 0 ? 0.0
                                    : static_cast<double>(completed_tasks) /
                                          static_cast<double>(total_tasks);
        }
    };

    struct Summary {
        std::size_t active_threads = 0;
        std::size_t total_tasks = 0;
        std::size_t completed_tasks = 0;
        std::size_t failed_tasks = 0;
        double uptime_seconds = 0.0;

        double success_rate() const {
            return total_tasks == 0 ? 0.0
                                    : static_cast<double>(completed_tasks) /
                                          static_cast<double>(total_tasks);
        }
    };

    ThreadMonitor();

    ThreadMonitor(const ThreadMonitor &) = delete;
    ThreadMonitor &operator=(const ThreadMonitor &) = delete;

    // No-op if already registered
    void register_thread(WorkerId thread_id);
    void unregister_thread(WorkerId thread_id);

    void start_task(WorkerId thread_id, const std::string &task_id);
    void end_task(WorkerId thread_id, const std::string &task_id,
                  bool success = true);

    std::optional<ThreadStats> thread_stats(WorkerId thread_id) const;
    std::map<WorkerId, ThreadStats> all_stats() const;
    Summary summary() const;

    // Forget all threads and tasks in flight
    void clear();

   private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point start_time;
        std::size_t total_tasks = 0;
        std::size_t completed_tasks = 0;
        std::size_t failed_tasks = 0;
        double avg_task_time = 0.0;
    };

    ThreadStats to_stats(WorkerId thread_id, const Entry &entry,
                         Clock::time_point now) const;

    mutable std::mutex mutex_;
    Clock::time_point start_time_;
    std::map<WorkerId, Entry> threads_;
    std::unordered_map<std::string, Clock::time_point> task_starts_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_MONITORING_THREAD_MONITOR_H
