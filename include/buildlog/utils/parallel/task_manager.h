#ifndef BUILDLOG_UTILS_PARALLEL_TASK_MANAGER_H
#define BUILDLOG_UTILS_PARALLEL_TASK_MANAGER_H

#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/parallel/chunk.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace buildlog::utils {

/**
 * Splits a file into consecutive byte ranges of chunk_size bytes (the last
 * one shorter) and hands them out in file order.
 */
class TaskManager {
   public:
    explicit TaskManager(
        std::size_t chunk_size = constants::parallel::DEFAULT_TASK_CHUNK_SIZE);

    /**
     * Replace any pending tasks with the ranges of path
     * @return number of tasks prepared
     * @throws ReaderError NOT_FOUND if path does not exist
     */
    std::size_t prepare_file_tasks(const std::string &path);

    bool get_next_task(Chunk &chunk);

    std::size_t pending() const;
    void clear();

    std::size_t chunk_size() const { return chunk_size_; }

    // Size of the file covered by the last prepare_file_tasks call
    std::uint64_t file_size() const { return file_size_.load(); }

   private:
    std::size_t chunk_size_;
    std::atomic<std::uint64_t> file_size_;
    mutable std::mutex mutex_;
    std::deque<Chunk> tasks_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_PARALLEL_TASK_MANAGER_H
