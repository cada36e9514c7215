#include <buildlog/utils/config/reader_config.h>
#include <buildlog/utils/reader/error.h>

#include <string>

namespace buildlog::utils {

namespace {
void require(bool condition, const std::string &message) {
    if (!condition) {
        throw ReaderError(ReaderError::VALIDATION_ERROR, message);
    }
}
}  // namespace

void ReaderConfigManager::validate() const {
    require(chunk_size_ > 0, "chunk_size must be positive");
    require(buffer_size_ > 0, "buffer_size must be positive");
    require(max_line_length_ > 0, "max_line_length must be positive");
    require(cache_size_ > 0, "cache_size must be positive");
    require(cache_ttl_ > 0.0, "cache_ttl must be positive");
    require(max_workers_ >= constants::parallel::MIN_WORKERS &&
                max_workers_ <= constants::parallel::MAX_WORKERS,
            "max_workers must be between " +
                std::to_string(constants::parallel::MIN_WORKERS) + " and " +
                std::to_string(constants::parallel::MAX_WORKERS) + ", got " +
                std::to_string(max_workers_));
    require(max_retries_ >= 0, "max_retries must not be negative");
    require(retry_delay_ >= 0.0, "retry_delay must not be negative");
    require(prefetch_size_ > 0, "prefetch_size must be positive");
    require(prefetch_timeout_ > 0.0, "prefetch_timeout must be positive");
}

}  // namespace buildlog::utils
