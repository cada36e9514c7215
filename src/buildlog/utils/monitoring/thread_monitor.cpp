#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/monitoring/thread_monitor.h>

namespace buildlog::utils {

ThreadMonitor::ThreadMonitor() : start_time_(Clock::now()) {}

void ThreadMonitor::register_thread(WorkerId thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (threads_.count(thread_id) != 0) {
        return;
    }
    Entry entry;
    entry.start_time = Clock::now();
    threads_[thread_id] = entry;
    BUILDLOG_UTILS_LOG_DEBUG("Monitoring thread %d", thread_id);
}

void ThreadMonitor::unregister_thread(WorkerId thread_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (threads_.erase(thread_id) != 0) {
        BUILDLOG_UTILS_LOG_DEBUG("Stopped monitoring thread %d", thread_id);
    }
}

void ThreadMonitor::start_task(WorkerId thread_id,
                               const std::string &task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return;
    }
    ++it->second.total_tasks;
    task_starts_[task_id] = Clock::now();
}

void ThreadMonitor::end_task(WorkerId thread_id, const std::string &task_id,
                             bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    auto started = task_starts_.find(task_id);
    if (it == threads_.end() || started == task_starts_.end()) {
        return;
    }
    double elapsed =
        std::chrono::duration<double>(Clock::now() - started->second)
            .count();
    task_starts_.erase(started);

    Entry &entry = it->second;
    if (success) {
        ++entry.completed_tasks;
    } else {
        ++entry.failed_tasks;
    }
    double finished =
        static_cast<double>(entry.completed_tasks + entry.failed_tasks);
    entry.avg_task_time += (elapsed - entry.avg_task_time) / finished;
}

ThreadMonitor::ThreadStats ThreadMonitor::to_stats(
    WorkerId thread_id, const Entry &entry, Clock::time_point now) const {
    ThreadStats stats;
    stats.thread_id = thread_id;
    stats.total_tasks = entry.total_tasks;
    stats.completed_tasks = entry.completed_tasks;
    stats.failed_tasks = entry.failed_tasks;
    stats.avg_task_time = entry.avg_task_time;
    stats.uptime_seconds =
        std::chrono::duration<double>(now - entry.start_time).count();
    return stats;
}

std::optional<ThreadMonitor::ThreadStats> ThreadMonitor::thread_stats(
    WorkerId thread_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = threads_.find(thread_id);
    if (it == threads_.end()) {
        return std::nullopt;
    }
    return to_stats(thread_id, it->second, Clock::now());
}

std::map<WorkerId, ThreadMonitor::ThreadStats> ThreadMonitor::all_stats()
    const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = Clock::now();
    std::map<WorkerId, ThreadStats> result;
    for (const auto &entry : threads_) {
        result[entry.first] = to_stats(entry.first, entry.second, now);
    }
    return result;
}

ThreadMonitor::Summary ThreadMonitor::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Summary summary;
    summary.active_threads = threads_.size();
    for (const auto &entry : threads_) {
        summary.total_tasks += entry.second.total_tasks;
        summary.completed_tasks += entry.second.completed_tasks;
        summary.failed_tasks += entry.second.failed_tasks;
    }
    summary.uptime_seconds =
        std::chrono::duration<double>(Clock::now() - start_time_).count();
    return summary;
}

void ThreadMonitor::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    threads_.clear();
    task_starts_.clear();
}

}  // namespace buildlog::utils
