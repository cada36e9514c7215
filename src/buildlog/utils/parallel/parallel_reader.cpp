#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/parallel/parallel_reader.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>

namespace buildlog::utils {

namespace {
const ReaderConfigManager &validated(const ReaderConfigManager &config) {
    config.validate();
    return config;
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                         start)
        .count();
}
}  // namespace

const char *parallel_reader_state_name(ParallelReader::State state) {
    switch (state) {
        case ParallelReader::State::Uninitialized:
            return "uninitialized";
        case ParallelReader::State::Initialized:
            return "initialized";
        case ParallelReader::State::Reading:
            return "reading";
        case ParallelReader::State::Closed:
            return "closed";
    }
    return "unknown";
}

ParallelReader::ParallelReader(const std::string &path,
                               const ReaderConfigManager &config,
                               std::shared_ptr<StatsCollector> stats)
    : path_(path),
      config_(validated(config)),
      stats_(std::move(stats)),
      source_opener_([](const std::string &p) {
          return std::make_unique<TextFileSource>(p);
      }),
      thread_pool_(config_.max_workers()),
      task_manager_(config_.chunk_size()),
      load_balancer_(std::max<std::size_t>(config_.max_workers() / 2, 1),
                     config_.max_workers()),
      error_handler_(static_cast<std::size_t>(config_.max_retries()),
                     config_.retry_delay()),
      state_(State::Uninitialized) {}

ParallelReader::~ParallelReader() { close(); }

void ParallelReader::set_source_opener(SourceOpener opener) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::Uninitialized && state_ != State::Closed) {
        throw ReaderError(ReaderError::TASK_ERROR,
                          "Source opener must be set before initialize()");
    }
    if (!opener) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Source opener must not be empty");
    }
    source_opener_ = std::move(opener);
}

void ParallelReader::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Initialized || state_ == State::Reading) {
        return;
    }
    std::unique_ptr<FileSource> source = source_opener_(path_);
    source->open();
    source_ = std::move(source);
    error_handler_.resume();
    thread_pool_.start();
    state_ = State::Initialized;
    BUILDLOG_UTILS_LOG_INFO("Parallel reader initialized for %s with %zu "
                            "workers",
                            path_.c_str(), config_.max_workers());
}

void ParallelReader::close() {
    std::unique_ptr<FileSource> source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Uninitialized || state_ == State::Closed) {
            return;
        }
        state_ = State::Closed;
        source = std::move(source_);
        worker_tasks_.clear();
    }
    error_handler_.cancel();
    thread_pool_.stop(false);
    if (source) {
        source->close();
    }
    BUILDLOG_UTILS_LOG_INFO("Parallel reader closed for %s", path_.c_str());
}

ParallelReader::State ParallelReader::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<ReadResult> ParallelReader::read_chunks() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::Initialized) {
            throw ReaderError(ReaderError::TASK_ERROR,
                              std::string("Parallel reader is ") +
                                  parallel_reader_state_name(state_) +
                                  ", expected initialized");
        }
        state_ = State::Reading;
    }
    error_handler_.clear_all_errors();

    auto start = std::chrono::steady_clock::now();
    std::vector<std::future<ReadResult>> futures;
    std::size_t count = 0;
    std::exception_ptr first_error;
    try {
        count = task_manager_.prepare_file_tasks(path_);
        futures.reserve(count);
        Chunk chunk;
        while (task_manager_.get_next_task(chunk)) {
            futures.push_back(thread_pool_.submit(
                [this, chunk]() { return process_chunk(chunk); }));
        }
    } catch (const ReaderError &e) {
        BUILDLOG_UTILS_LOG_ERROR("Failed to schedule %s: %s", path_.c_str(),
                                 e.what());
        first_error = std::current_exception();
    }
    BUILDLOG_UTILS_LOG_DEBUG("Submitted %zu of %zu chunks of %s",
                             futures.size(), count, path_.c_str());

    // Every future is waited on so no task outlives this call
    std::vector<ReadResult> results;
    results.reserve(futures.size());
    for (auto &future : futures) {
        try {
            results.push_back(future.get());
            if (stats_) {
                stats_->record_metric("parallel_chunk_processed", 1.0);
            }
        } catch (const std::exception &e) {
            BUILDLOG_UTILS_LOG_ERROR("Chunk of %s failed: %s", path_.c_str(),
                                     e.what());
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
    task_manager_.clear();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::Reading) {
            state_ = State::Initialized;
        }
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }

    std::sort(results.begin(), results.end(),
              [](const ReadResult &a, const ReadResult &b) {
                  return a.position < b.position;
              });
    if (stats_) {
        stats_->collect_operation_latency("read_chunks", seconds_since(start));
    }
    return results;
}

ReadResult ParallelReader::process_chunk(const Chunk &chunk) {
    WorkerId worker_id = ThreadPool::current_worker_id();
    std::string task_id = "chunk_" + std::to_string(chunk.chunk_id);

    load_balancer_.register_worker(worker_id);
    thread_monitor_.register_thread(worker_id);
    thread_monitor_.start_task(worker_id, task_id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker_tasks_[worker_id] = task_id;
    }
    if (stats_) {
        stats_->record_metric("parallel_chunk_start", 1.0);
    }

    for (std::size_t attempt = 1;; ++attempt) {
        auto start = std::chrono::steady_clock::now();
        ReaderError::Type kind = ReaderError::READ_ERROR;
        std::string message;
        try {
            ReadResult result = read_range(chunk, worker_id, attempt);
            double elapsed = seconds_since(start);
            load_balancer_.update_worker_stats(worker_id, elapsed,
                                               result.size);
            if (stats_) {
                stats_->collect_io_stats(result.size, elapsed);
                stats_->collect_operation_latency("parallel_chunk", elapsed);
            }
            error_handler_.clear_error(task_id);
            thread_monitor_.end_task(worker_id, task_id, true);
            return result;
        } catch (const ReaderError &e) {
            kind = e.get_type();
            message = e.get_message();
        } catch (const std::exception &e) {
            kind = ReaderError::READ_ERROR;
            message = e.what();
        }

        if (!retry_after_failure(chunk, worker_id, task_id,
                                 seconds_since(start), kind, message)) {
            thread_monitor_.end_task(worker_id, task_id, false);
            throw ReaderError(ReaderError::TASK_ERROR,
                              "Chunk " + std::to_string(chunk.chunk_id) +
                                  " failed after " + std::to_string(attempt) +
                                  " attempts: [" +
                                  ReaderError::type_name(kind) + "] " +
                                  message);
        }
        BUILDLOG_UTILS_LOG_INFO("Retrying chunk %zu on worker %d",
                                chunk.chunk_id, worker_id);
    }
}

bool ParallelReader::retry_after_failure(const Chunk &chunk,
                                         WorkerId worker_id,
                                         const std::string &task_id,
                                         double elapsed,
                                         ReaderError::Type kind,
                                         const std::string &message) {
    BUILDLOG_UTILS_LOG_ERROR("Error in chunk %zu (worker %d): %s",
                             chunk.chunk_id, worker_id, message.c_str());

    // Decided on the worker's record before this failure counts against it
    bool allowed = load_balancer_.should_retry(
        worker_id, error_handler_.error_count(task_id));
    load_balancer_.update_worker_stats(worker_id, elapsed, 0, true);
    if (stats_) {
        stats_->record_metric("parallel_chunk_error", 1.0);
    }

    Metadata metadata;
    metadata["chunk_id"] = std::to_string(chunk.chunk_id);
    metadata["worker_id"] = std::to_string(worker_id);
    metadata["start_offset"] = std::to_string(chunk.start_offset);
    metadata["chunk_size"] = std::to_string(chunk.size);
    return error_handler_.handle_error(kind, message, task_id, metadata,
                                       allowed);
}

ReadResult ParallelReader::read_range(const Chunk &chunk, WorkerId worker_id,
                                      std::size_t attempt) {
    std::size_t step =
        std::max<std::size_t>(load_balancer_.optimal_chunk_size(), 1);

    std::unique_ptr<FileSource> source = source_opener_(chunk.file_path);
    source->open();
    source->seek(static_cast<std::int64_t>(chunk.start_offset), SEEK_SET);

    std::string content;
    content.reserve(chunk.size);
    while (content.size() < chunk.size) {
        std::size_t want = std::min(step, chunk.size - content.size());
        std::string part = source->read(static_cast<std::int64_t>(want));
        if (part.empty()) {
            break;
        }
        content.append(part);
    }
    source->close();

    if (content.size() != chunk.size) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Short read at offset " +
                              std::to_string(chunk.start_offset) + ": got " +
                              std::to_string(content.size()) + " of " +
                              std::to_string(chunk.size) + " bytes");
    }

    ReadResult result;
    result.position = chunk.start_offset;
    result.size = content.size();
    result.is_eof =
        chunk.start_offset + content.size() >= task_manager_.file_size();
    result.content = std::move(content);
    result.metadata["chunk_id"] = std::to_string(chunk.chunk_id);
    result.metadata["original_size"] = std::to_string(chunk.size);
    result.metadata["worker_id"] = std::to_string(worker_id);
    result.metadata["attempts"] = std::to_string(attempt);
    return result;
}

ParallelReader::WorkerStatsSnapshot ParallelReader::worker_stats() const {
    WorkerStatsSnapshot snapshot;
    std::vector<WorkerId> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &entry : worker_tasks_) {
            ids.push_back(entry.first);
        }
    }
    for (WorkerId id : ids) {
        std::optional<WorkerHealth> health = load_balancer_.worker_health(id);
        if (health) {
            snapshot.workers[id] = *health;
        }
    }
    snapshot.unhealthy_workers = load_balancer_.unhealthy_workers();
    snapshot.optimal_chunk_size = load_balancer_.optimal_chunk_size();
    snapshot.active_workers = ids.size();
    return snapshot;
}

}  // namespace buildlog::utils
