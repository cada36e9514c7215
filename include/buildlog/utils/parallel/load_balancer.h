#ifndef BUILDLOG_UTILS_PARALLEL_LOAD_BALANCER_H
#define BUILDLOG_UTILS_PARALLEL_LOAD_BALANCER_H

#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/typedefs.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace buildlog::utils {

struct WorkerStats {
    WorkerId worker_id = 0;
    double processing_time = 0.0;
    std::uint64_t processed_bytes = 0;
    std::size_t error_count = 0;
    std::size_t total_tasks = 0;
    std::chrono::system_clock::time_point last_active;

    // Bytes per second
    double throughput() const {
        return processing_time <= 0.0
                   ? 0.0
                   : static_cast<double>(processed_bytes) / processing_time;
    }

    double error_rate() const {
        return total_tasks == 0 ? 0.0
                                : static_cast<double>(error_count) /
                                      static_cast<double>(total_tasks);
    }

    bool is_healthy() const {
        return error_rate() < constants::parallel::HEALTHY_ERROR_RATE;
    }
};

struct WorkerHealth {
    double throughput = 0.0;
    double error_rate = 0.0;
    std::size_t total_tasks = 0;
    std::uint64_t processed_bytes = 0;
    double processing_time = 0.0;
    bool healthy = true;
};

/**
 * Tracks per-worker throughput and error rates and keeps one recommended
 * chunk size for all workers.
 *
 * After each update the reporting worker's throughput is compared with the
 * mean of every other worker that has a positive throughput. A relative
 * difference above 20% halves the recommendation when the worker is slower
 * and doubles it when faster, within [MIN_CHUNK_SIZE, MAX_CHUNK_SIZE].
 */
class LoadBalancer {
   public:
    LoadBalancer(std::size_t initial_workers = 2,
                 std::size_t max_workers = constants::parallel::MAX_WORKERS);

    void register_worker(WorkerId worker_id);

    void update_worker_stats(WorkerId worker_id, double processing_time,
                             std::uint64_t processed_bytes,
                             bool had_error = false);

    std::size_t optimal_chunk_size() const;

    /**
     * Retry policy for a failed task on a worker. Unknown workers get the
     * default budget; unhealthy workers are never retried.
     */
    bool should_retry(WorkerId worker_id, std::size_t error_count) const;

    // Unknown workers count as healthy
    bool is_worker_healthy(WorkerId worker_id) const;

    std::vector<WorkerId> unhealthy_workers() const;
    std::optional<WorkerHealth> worker_health(WorkerId worker_id) const;

    // Recommended number of workers
    std::size_t worker_count() const;
    std::size_t max_workers() const { return max_workers_; }

   private:
    void adjust_chunk_size(WorkerId worker_id, double throughput);

    mutable std::mutex mutex_;
    std::size_t max_workers_;
    std::size_t current_workers_;
    std::size_t optimal_chunk_size_;
    std::map<WorkerId, WorkerStats> worker_stats_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_PARALLEL_LOAD_BALANCER_H
