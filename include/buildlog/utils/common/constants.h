#ifndef BUILDLOG_UTILS_COMMON_CONSTANTS_H
#define BUILDLOG_UTILS_COMMON_CONSTANTS_H

#include <cstddef>
#include <cstdint>

namespace buildlog::utils::constants {
namespace reader {
static constexpr std::size_t DEFAULT_CHUNK_SIZE = 8 * 1024 * 1024;  // 8MB
static constexpr std::size_t DEFAULT_BUFFER_SIZE = 4096;            // 4KB
static constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 1024 * 1024;  // 1MB
static constexpr std::size_t FILE_IO_BUFFER_SIZE =
    262144;  // 256KB for file I/O
static constexpr std::size_t GZIP_BUFFER_SIZE = 65536;  // 64KB
static constexpr std::size_t SKIP_BUFFER_SIZE = 131072;  // 128KB
static constexpr int ZLIB_GZIP_WINDOW_BITS = 31;  // 15 + 16 for gzip format
}  // namespace reader

namespace iterators {
static constexpr std::size_t MIN_AUTO_CHUNK_SIZE = 64 * 1024;   // 64KB
static constexpr std::size_t MAX_AUTO_CHUNK_SIZE = 256 * 1024;  // 256KB
static constexpr std::size_t AUTO_CHUNK_DIVISOR = 1000;
static constexpr std::size_t DEFAULT_PREFETCH_SIZE = 3;
static constexpr std::size_t MIN_PREFETCH_QUEUE_SIZE = 100;
static constexpr std::size_t MAX_PREFETCH_BATCH_SIZE = 50;
static constexpr double DEFAULT_PREFETCH_TIMEOUT = 0.1;  // seconds
static constexpr double MIN_PREFETCH_TIMEOUT = 0.001;
static constexpr double MAX_PREFETCH_TIMEOUT = 1.0;
}  // namespace iterators

namespace cache {
static constexpr std::size_t DEFAULT_CACHE_SIZE = 100 * 1024 * 1024;  // 100MB
static constexpr double DEFAULT_TTL = 300.0;  // seconds
}  // namespace cache

namespace monitoring {
static constexpr double DEFAULT_MEMORY_THRESHOLD = 0.8;
static constexpr double DEFAULT_SAMPLING_INTERVAL = 5.0;  // seconds
static constexpr std::size_t MAX_MEMORY_SNAPSHOTS = 100;
static constexpr std::size_t DEFAULT_LEAK_WINDOW = 10;
static constexpr double LEAK_GROWTH_RATE = 0.1;
}  // namespace monitoring

namespace parallel {
static constexpr std::size_t DEFAULT_TASK_CHUNK_SIZE = 1024 * 1024;  // 1MB
static constexpr std::size_t MIN_CHUNK_SIZE = 64 * 1024;             // 64KB
static constexpr std::size_t MAX_CHUNK_SIZE = 8 * 1024 * 1024;       // 8MB
static constexpr std::size_t MIN_WORKERS = 1;
static constexpr std::size_t MAX_WORKERS = 4;
static constexpr double ADJUSTMENT_THRESHOLD = 0.2;
static constexpr double HEALTHY_ERROR_RATE = 0.1;
static constexpr double RETRY_ERROR_RATE = 0.3;
static constexpr std::size_t DEFAULT_RETRY_BUDGET = 3;
static constexpr std::size_t DEFAULT_MAX_RETRIES = 3;
static constexpr double DEFAULT_RETRY_DELAY = 1.0;  // seconds
static constexpr double MAX_RETRY_DELAY = 30.0;     // seconds
}  // namespace parallel
}  // namespace buildlog::utils::constants

#endif  // BUILDLOG_UTILS_COMMON_CONSTANTS_H
