#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/parallel/task_manager.h>
#include <buildlog/utils/reader/error.h>
#include <buildlog/utils/utils/filesystem.h>

#include <algorithm>
#include <system_error>

namespace buildlog::utils {

TaskManager::TaskManager(std::size_t chunk_size)
    : chunk_size_(chunk_size), file_size_(0) {
    if (chunk_size_ == 0) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Task chunk size must be positive");
    }
}

std::size_t TaskManager::prepare_file_tasks(const std::string &path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ReaderError(ReaderError::NOT_FOUND, "File not found: " + path);
    }
    std::uint64_t total = fs::file_size(path, ec);
    if (ec) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to stat file: " + path + " (" +
                              ec.message() + ")");
    }

    std::deque<Chunk> tasks;
    TaskIndex chunk_id = 0;
    for (std::uint64_t offset = 0; offset < total; offset += chunk_size_) {
        Chunk chunk;
        chunk.file_path = path;
        chunk.start_offset = offset;
        chunk.size = static_cast<std::size_t>(
            std::min<std::uint64_t>(chunk_size_, total - offset));
        chunk.chunk_id = chunk_id++;
        tasks.push_back(std::move(chunk));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.swap(tasks);
        file_size_ = total;
    }

    BUILDLOG_UTILS_LOG_DEBUG("Prepared %zu tasks of %zu bytes for %s (%llu "
                             "bytes)",
                             chunk_id, chunk_size_, path.c_str(),
                             static_cast<unsigned long long>(total));
    return chunk_id;
}

bool TaskManager::get_next_task(Chunk &chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.empty()) {
        return false;
    }
    chunk = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
}

std::size_t TaskManager::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void TaskManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.clear();
}

}  // namespace buildlog::utils
