#ifndef BUILDLOG_UTILS_CACHE_CACHED_FILE_READER_H
#define BUILDLOG_UTILS_CACHE_CACHED_FILE_READER_H

#include <buildlog/utils/cache/cache_manager.h>
#include <buildlog/utils/reader/file_source_factory.h>

#include <memory>
#include <string>

namespace buildlog::utils {

class StatsCollector;

namespace cache {

/**
 * Memoizes whole-file reads. Content is keyed by path and read through a
 * FileSource chosen by the factory, so gzip files are cached decompressed.
 */
class CachedFileReader {
   public:
    CachedFileReader(CacheManager<std::string> &cache,
                     std::shared_ptr<StatsCollector> stats = nullptr);

    std::string read_all(const std::string &path);
    void invalidate(const std::string &path);

    FileSourceFactory &factory() { return factory_; }

   private:
    CacheManager<std::string> &cache_;
    std::shared_ptr<StatsCollector> stats_;
    FileSourceFactory factory_;
};

}  // namespace cache
}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_CACHE_CACHED_FILE_READER_H
