#include <buildlog/utils/cache/cached_file_reader.h>
#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/monitoring/stats_collector.h>

#include <chrono>

namespace buildlog::utils::cache {

CachedFileReader::CachedFileReader(CacheManager<std::string> &cache,
                                   std::shared_ptr<StatsCollector> stats)
    : cache_(cache), stats_(std::move(stats)) {}

std::string CachedFileReader::read_all(const std::string &path) {
    std::optional<std::string> cached = cache_.get(path);
    if (cached) {
        if (stats_) {
            stats_->record_cache_hit();
        }
        BUILDLOG_UTILS_LOG_DEBUG("Cache hit for %s", path.c_str());
        return *cached;
    }
    if (stats_) {
        stats_->record_cache_miss();
    }

    auto start = std::chrono::steady_clock::now();
    std::unique_ptr<FileSource> source = factory_.create(path);
    source->open();
    std::string content = source->read_all();
    source->close();
    double elapsed = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - start)
                         .count();
    if (stats_) {
        stats_->collect_io_stats(content.size(), elapsed);
        stats_->collect_operation_latency("read_all", elapsed);
    }

    cache_.put(path, content);
    return content;
}

void CachedFileReader::invalidate(const std::string &path) {
    cache_.remove(path);
}

}  // namespace buildlog::utils::cache
