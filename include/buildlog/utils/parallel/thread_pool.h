#ifndef BUILDLOG_UTILS_PARALLEL_THREAD_POOL_H
#define BUILDLOG_UTILS_PARALLEL_THREAD_POOL_H

#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/typedefs.h>
#include <buildlog/utils/reader/error.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace buildlog::utils {

/**
 * Fixed set of worker threads fed from one FIFO queue.
 *
 * Workers are numbered 0..max_workers-1 when the pool starts, and a task can
 * ask which worker runs it through current_worker_id().
 */
class ThreadPool {
   public:
    explicit ThreadPool(
        std::size_t max_workers = constants::parallel::MAX_WORKERS);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    void start();

    /**
     * Stop the workers. With wait, queued tasks run first. Without it, queued
     * tasks are abandoned and their futures fail with TASK_ERROR; tasks
     * already running are always allowed to finish.
     */
    void stop(bool wait = true);

    /**
     * @throws ReaderError TASK_ERROR if the pool is not running
     */
    template <typename F>
    std::future<std::invoke_result_t<std::decay_t<F>>> submit(F &&fn) {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();

        Job job;
        job.run = [promise,
                   task = std::decay_t<F>(std::forward<F>(fn))]() mutable {
            try {
                if constexpr (std::is_void_v<Result>) {
                    task();
                    promise->set_value();
                } else {
                    promise->set_value(task());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        };
        job.abandon = [promise]() {
            promise->set_exception(std::make_exception_ptr(ReaderError(
                ReaderError::TASK_ERROR,
                "Task abandoned because the pool was stopped")));
        };

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active_ || stopping_) {
                throw ReaderError(ReaderError::TASK_ERROR,
                                  "Cannot submit to an inactive thread pool");
            }
            jobs_.push_back(std::move(job));
        }
        cond_.notify_one();
        return future;
    }

    bool is_active() const;
    std::size_t max_workers() const { return max_workers_; }
    std::size_t pending() const;

    // Id of the pool worker running the caller, or -1 outside any pool
    static WorkerId current_worker_id();

   private:
    struct Job {
        std::function<void()> run;
        std::function<void()> abandon;
    };

    void worker_loop(WorkerId worker_id);

    const std::size_t max_workers_;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Job> jobs_;
    std::vector<std::thread> workers_;
    bool active_;
    bool stopping_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_PARALLEL_THREAD_POOL_H
