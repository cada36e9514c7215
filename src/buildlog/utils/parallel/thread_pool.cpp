#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/parallel/thread_pool.h>

#include <string>

namespace buildlog::utils {

namespace {
thread_local WorkerId current_worker = -1;
}  // namespace

ThreadPool::ThreadPool(std::size_t max_workers)
    : max_workers_(max_workers), active_(false), stopping_(false) {
    if (max_workers_ < constants::parallel::MIN_WORKERS ||
        max_workers_ > constants::parallel::MAX_WORKERS) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Thread pool size must be between " +
                              std::to_string(constants::parallel::MIN_WORKERS) +
                              " and " +
                              std::to_string(constants::parallel::MAX_WORKERS) +
                              ", got " + std::to_string(max_workers_));
    }
}

ThreadPool::~ThreadPool() { stop(false); }

void ThreadPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        return;
    }
    stopping_ = false;
    active_ = true;
    workers_.reserve(max_workers_);
    for (std::size_t i = 0; i < max_workers_; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this,
                              static_cast<WorkerId>(i));
    }
    BUILDLOG_UTILS_LOG_DEBUG("Started thread pool with %zu workers",
                             max_workers_);
}

void ThreadPool::stop(bool wait) {
    std::deque<Job> abandoned;
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            return;
        }
        stopping_ = true;
        if (!wait) {
            abandoned.swap(jobs_);
        }
        workers.swap(workers_);
    }
    cond_.notify_all();

    for (auto &job : abandoned) {
        job.abandon();
    }
    for (auto &worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_ = false;
        stopping_ = false;
    }
    BUILDLOG_UTILS_LOG_DEBUG("Stopped thread pool (%zu tasks abandoned)",
                             abandoned.size());
}

bool ThreadPool::is_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && !stopping_;
}

std::size_t ThreadPool::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

WorkerId ThreadPool::current_worker_id() { return current_worker; }

void ThreadPool::worker_loop(WorkerId worker_id) {
    current_worker = worker_id;
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                break;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job.run();
    }
    current_worker = -1;
}

}  // namespace buildlog::utils
