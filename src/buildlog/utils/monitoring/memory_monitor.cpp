#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/monitoring/memory_monitor.h>
#include <buildlog/utils/reader/error.h>
#include <unistd.h>

#include <fstream>
#include <string>

namespace buildlog::utils {

namespace {
std::uint64_t page_size() {
    long size = ::sysconf(_SC_PAGESIZE);
    return size > 0 ? static_cast<std::uint64_t>(size) : 4096;
}
}  // namespace

std::uint64_t process_rss_bytes() {
    std::ifstream statm("/proc/self/statm");
    std::uint64_t vm_pages = 0;
    std::uint64_t rss_pages = 0;
    if (!statm || !(statm >> vm_pages >> rss_pages)) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to read /proc/self/statm");
    }
    return rss_pages * page_size();
}

std::uint64_t physical_memory_bytes() {
    long pages = ::sysconf(_SC_PHYS_PAGES);
    if (pages <= 0) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to query physical memory size");
    }
    return static_cast<std::uint64_t>(pages) * page_size();
}

MemoryMonitor::MemoryMonitor(double threshold, double sampling_interval)
    : threshold_(threshold),
      sampling_interval_(sampling_interval),
      monitoring_(false) {
    if (!(threshold_ > 0.0 && threshold_ <= 1.0)) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Memory threshold must be in (0, 1], got " +
                              std::to_string(threshold_));
    }
    if (!(sampling_interval_ > 0.0)) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Sampling interval must be positive, got " +
                              std::to_string(sampling_interval_));
    }
}

MemoryMonitor::~MemoryMonitor() { stop_monitoring(); }

void MemoryMonitor::start_monitoring() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (monitoring_) {
        return;
    }
    monitoring_ = true;
    thread_ = std::thread(&MemoryMonitor::run, this);
    BUILDLOG_UTILS_LOG_DEBUG("Memory monitor sampling every %.3f s",
                             sampling_interval_);
}

void MemoryMonitor::stop_monitoring() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitoring_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool MemoryMonitor::is_monitoring() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitoring_;
}

void MemoryMonitor::run() {
    auto interval = std::chrono::duration<double>(sampling_interval_);
    std::unique_lock<std::mutex> lock(mutex_);
    while (monitoring_) {
        lock.unlock();
        try {
            take_snapshot();
        } catch (const ReaderError &e) {
            BUILDLOG_UTILS_LOG_WARN("Memory sample failed: %s", e.what());
        }
        lock.lock();
        cv_.wait_for(lock, interval, [this] { return !monitoring_; });
    }
}

MemorySnapshot MemoryMonitor::take_snapshot() {
    MemorySnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.total_bytes = physical_memory_bytes();
    snapshot.used_bytes = process_rss_bytes();
    snapshot.usage = static_cast<double>(snapshot.used_bytes) /
                     static_cast<double>(snapshot.total_bytes);

    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.push_back(snapshot);
    while (snapshots_.size() > constants::monitoring::MAX_MEMORY_SNAPSHOTS) {
        snapshots_.pop_front();
    }
    return snapshot;
}

double MemoryMonitor::check_memory_usage() const {
    return static_cast<double>(process_rss_bytes()) /
           static_cast<double>(physical_memory_bytes());
}

bool MemoryMonitor::above_threshold() const {
    double usage = check_memory_usage();
    if (usage > threshold_) {
        BUILDLOG_UTILS_LOG_WARN("Memory usage %.1f%% above threshold %.1f%%",
                                usage * 100.0, threshold_ * 100.0);
        return true;
    }
    return false;
}

std::vector<MemorySnapshot> MemoryMonitor::memory_trend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<MemorySnapshot>(snapshots_.begin(), snapshots_.end());
}

bool MemoryMonitor::detect_memory_leak(std::size_t window_size) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (window_size < 2 || snapshots_.size() < window_size) {
        return false;
    }
    const MemorySnapshot &first = snapshots_[snapshots_.size() - window_size];
    const MemorySnapshot &last = snapshots_.back();
    if (first.used_bytes == 0) {
        return false;
    }
    double growth = (static_cast<double>(last.used_bytes) -
                     static_cast<double>(first.used_bytes)) /
                    static_cast<double>(first.used_bytes);
    return growth > constants::monitoring::LEAK_GROWTH_RATE;
}

}  // namespace buildlog::utils
