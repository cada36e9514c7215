#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/parallel/load_balancer.h>

#include <algorithm>
#include <cmath>

namespace buildlog::utils {

LoadBalancer::LoadBalancer(std::size_t initial_workers,
                           std::size_t max_workers)
    : max_workers_(std::max<std::size_t>(max_workers, 1)),
      current_workers_(std::min(std::max<std::size_t>(initial_workers, 1),
                                max_workers_)),
      optimal_chunk_size_(constants::parallel::DEFAULT_TASK_CHUNK_SIZE) {}

void LoadBalancer::register_worker(WorkerId worker_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_stats_.find(worker_id) == worker_stats_.end()) {
        WorkerStats stats;
        stats.worker_id = worker_id;
        stats.last_active = std::chrono::system_clock::now();
        worker_stats_.emplace(worker_id, stats);
        BUILDLOG_UTILS_LOG_DEBUG("Registered worker %d", worker_id);
    }
}

void LoadBalancer::update_worker_stats(WorkerId worker_id,
                                       double processing_time,
                                       std::uint64_t processed_bytes,
                                       bool had_error) {
    std::lock_guard<std::mutex> lock(mutex_);
    WorkerStats &stats = worker_stats_[worker_id];
    stats.worker_id = worker_id;
    stats.processing_time += processing_time;
    stats.processed_bytes += processed_bytes;
    stats.total_tasks += 1;
    stats.last_active = std::chrono::system_clock::now();
    if (had_error) {
        stats.error_count += 1;
    }
    adjust_chunk_size(worker_id, stats.throughput());
}

void LoadBalancer::adjust_chunk_size(WorkerId worker_id, double throughput) {
    if (throughput <= 0.0) {
        return;
    }

    double sum = 0.0;
    std::size_t others = 0;
    for (const auto &entry : worker_stats_) {
        if (entry.first == worker_id) {
            continue;
        }
        double other = entry.second.throughput();
        if (other > 0.0) {
            sum += other;
            ++others;
        }
    }
    if (others == 0) {
        return;
    }

    double average = sum / static_cast<double>(others);
    if (std::abs(throughput - average) / average <=
        constants::parallel::ADJUSTMENT_THRESHOLD) {
        return;
    }

    std::size_t previous = optimal_chunk_size_;
    if (throughput < average) {
        optimal_chunk_size_ = std::max(optimal_chunk_size_ / 2,
                                       constants::parallel::MIN_CHUNK_SIZE);
    } else {
        optimal_chunk_size_ = std::min(optimal_chunk_size_ * 2,
                                       constants::parallel::MAX_CHUNK_SIZE);
    }
    if (previous != optimal_chunk_size_) {
        BUILDLOG_UTILS_LOG_DEBUG(
            "Adjusted chunk size from %zu to %zu (worker %d at %.0f B/s, "
            "others %.0f B/s)",
            previous, optimal_chunk_size_, worker_id, throughput, average);
    }
}

std::size_t LoadBalancer::optimal_chunk_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return optimal_chunk_size_;
}

bool LoadBalancer::should_retry(WorkerId worker_id,
                                std::size_t error_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = worker_stats_.find(worker_id);
    if (it == worker_stats_.end()) {
        return error_count < constants::parallel::DEFAULT_RETRY_BUDGET;
    }
    const WorkerStats &stats = it->second;
    if (!stats.is_healthy()) {
        BUILDLOG_UTILS_LOG_WARN("Worker %d is unhealthy (error rate %.2f)",
                                worker_id, stats.error_rate());
        return false;
    }
    return error_count < constants::parallel::DEFAULT_RETRY_BUDGET &&
           stats.error_rate() < constants::parallel::RETRY_ERROR_RATE;
}

bool LoadBalancer::is_worker_healthy(WorkerId worker_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = worker_stats_.find(worker_id);
    return it == worker_stats_.end() || it->second.is_healthy();
}

std::vector<WorkerId> LoadBalancer::unhealthy_workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkerId> result;
    for (const auto &entry : worker_stats_) {
        if (!entry.second.is_healthy()) {
            result.push_back(entry.first);
        }
    }
    return result;
}

std::optional<WorkerHealth> LoadBalancer::worker_health(
    WorkerId worker_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = worker_stats_.find(worker_id);
    if (it == worker_stats_.end()) {
        return std::nullopt;
    }
    const WorkerStats &stats = it->second;
    WorkerHealth health;
    health.throughput = stats.throughput();
    health.error_rate = stats.error_rate();
    health.total_tasks = stats.total_tasks;
    health.processed_bytes = stats.processed_bytes;
    health.processing_time = stats.processing_time;
    health.healthy = stats.is_healthy();
    return health;
}

std::size_t LoadBalancer::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_workers_;
}

}  // namespace buildlog::utils
