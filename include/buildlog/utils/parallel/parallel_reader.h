#ifndef BUILDLOG_UTILS_PARALLEL_PARALLEL_READER_H
#define BUILDLOG_UTILS_PARALLEL_PARALLEL_READER_H

#include <buildlog/utils/config/reader_config.h>
#include <buildlog/utils/monitoring/stats_collector.h>
#include <buildlog/utils/monitoring/thread_monitor.h>
#include <buildlog/utils/parallel/chunk.h>
#include <buildlog/utils/parallel/error_handler.h>
#include <buildlog/utils/parallel/load_balancer.h>
#include <buildlog/utils/parallel/task_manager.h>
#include <buildlog/utils/parallel/thread_pool.h>
#include <buildlog/utils/reader/file_source.h>
#include <buildlog/utils/reader/read_result.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace buildlog::utils {

/**
 * Reads a file as consecutive byte ranges on a thread pool.
 *
 * read_chunks() splits the file into config.chunk_size() ranges, reads each
 * one through its own FileSource on a pool worker and returns the results
 * ordered by position. Together they cover the file exactly. A failed range
 * is retried on the same worker while the ErrorHandler and LoadBalancer
 * allow it; otherwise the whole call fails with TASK_ERROR. Each call
 * starts from a clean retry budget.
 *
 * Ranges are raw on-disk bytes, so compressed files are not decompressed.
 */
class ParallelReader {
   public:
    enum class State { Uninitialized, Initialized, Reading, Closed };

    using SourceOpener =
        std::function<std::unique_ptr<FileSource>(const std::string &)>;

    struct WorkerStatsSnapshot {
        std::map<WorkerId, WorkerHealth> workers;
        std::vector<WorkerId> unhealthy_workers;
        std::size_t optimal_chunk_size = 0;
        std::size_t active_workers = 0;
    };

    ParallelReader(
        const std::string &path,
        const ReaderConfigManager &config = ReaderConfigManager::Default(),
        std::shared_ptr<StatsCollector> stats = nullptr);
    ~ParallelReader();

    ParallelReader(const ParallelReader &) = delete;
    ParallelReader &operator=(const ParallelReader &) = delete;

    // Must be called before initialize()
    void set_source_opener(SourceOpener opener);

    void initialize();

    /**
     * @throws ReaderError TASK_ERROR if the reader is not initialized or a
     * range could not be read
     */
    std::vector<ReadResult> read_chunks();

    void close();

    WorkerStatsSnapshot worker_stats() const;
    State state() const;

    // Register recovery handlers here before reading
    ErrorHandler &error_handler() { return error_handler_; }
    const LoadBalancer &load_balancer() const { return load_balancer_; }
    // Per-worker task counts and durations, one task per range
    const ThreadMonitor &thread_monitor() const { return thread_monitor_; }

    const std::string &path() const { return path_; }
    const ReaderConfigManager &config() const { return config_; }

   private:
    ReadResult process_chunk(const Chunk &chunk);
    ReadResult read_range(const Chunk &chunk, WorkerId worker_id,
                          std::size_t attempt);
    bool retry_after_failure(const Chunk &chunk, WorkerId worker_id,
                             const std::string &task_id, double elapsed,
                             ReaderError::Type kind,
                             const std::string &message);

    std::string path_;
    ReaderConfigManager config_;
    std::shared_ptr<StatsCollector> stats_;
    SourceOpener source_opener_;

    ThreadPool thread_pool_;
    TaskManager task_manager_;
    LoadBalancer load_balancer_;
    ErrorHandler error_handler_;
    ThreadMonitor thread_monitor_;

    mutable std::mutex mutex_;
    State state_;
    std::unique_ptr<FileSource> source_;
    std::map<WorkerId, std::string> worker_tasks_;
};

const char *parallel_reader_state_name(ParallelReader::State state);

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_PARALLEL_PARALLEL_READER_H
