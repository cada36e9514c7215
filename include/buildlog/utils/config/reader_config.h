#ifndef BUILDLOG_UTILS_CONFIG_READER_CONFIG_H
#define BUILDLOG_UTILS_CONFIG_READER_CONFIG_H

#include <buildlog/utils/common/constants.h>

#include <cstddef>
#include <cstdint>

namespace buildlog::utils {

/**
 * Validated value set consumed by the iterators, the cache layer and the
 * parallel reader. The constructor validates; setters do not, so call
 * validate() after a chain of setters.
 */
class ReaderConfigManager {
   public:
    ReaderConfigManager(
        std::size_t chunk_size = constants::reader::DEFAULT_CHUNK_SIZE,
        std::size_t buffer_size = constants::reader::DEFAULT_BUFFER_SIZE,
        std::size_t max_line_length =
            constants::reader::DEFAULT_MAX_LINE_LENGTH,
        std::size_t cache_size = constants::cache::DEFAULT_CACHE_SIZE,
        double cache_ttl = constants::cache::DEFAULT_TTL,
        bool enable_caching = true,
        std::size_t max_workers = constants::parallel::MAX_WORKERS,
        int max_retries =
            static_cast<int>(constants::parallel::DEFAULT_MAX_RETRIES),
        double retry_delay = constants::parallel::DEFAULT_RETRY_DELAY,
        std::size_t prefetch_size =
            constants::iterators::DEFAULT_PREFETCH_SIZE,
        double prefetch_timeout =
            constants::iterators::DEFAULT_PREFETCH_TIMEOUT)
        : chunk_size_(chunk_size),
          buffer_size_(buffer_size),
          max_line_length_(max_line_length),
          cache_size_(cache_size),
          cache_ttl_(cache_ttl),
          enable_caching_(enable_caching),
          max_workers_(max_workers),
          max_retries_(max_retries),
          retry_delay_(retry_delay),
          prefetch_size_(prefetch_size),
          prefetch_timeout_(prefetch_timeout) {
        validate();
    }

    inline static ReaderConfigManager Default() {
        return ReaderConfigManager();
    }
    inline static ReaderConfigManager create(
        std::size_t chunk_size = constants::reader::DEFAULT_CHUNK_SIZE,
        std::size_t max_workers = constants::parallel::MAX_WORKERS,
        int max_retries =
            static_cast<int>(constants::parallel::DEFAULT_MAX_RETRIES),
        double retry_delay = constants::parallel::DEFAULT_RETRY_DELAY) {
        ReaderConfigManager config;
        config.set_chunk_size(chunk_size)
            .set_max_workers(max_workers)
            .set_max_retries(max_retries)
            .set_retry_delay(retry_delay);
        config.validate();
        return config;
    }

    ReaderConfigManager(const ReaderConfigManager &) = default;
    ReaderConfigManager &operator=(const ReaderConfigManager &) = default;
    ReaderConfigManager(ReaderConfigManager &&) = default;
    ReaderConfigManager &operator=(ReaderConfigManager &&) = default;

    /**
     * @throws ReaderError VALIDATION_ERROR on zero sizes, a worker count
     * outside [MIN_WORKERS, MAX_WORKERS] or negative retries and delays
     */
    void validate() const;

    // Getter
    inline std::size_t chunk_size() const { return chunk_size_; }
    inline std::size_t buffer_size() const { return buffer_size_; }
    inline std::size_t max_line_length() const { return max_line_length_; }
    inline std::size_t cache_size() const { return cache_size_; }
    inline double cache_ttl() const { return cache_ttl_; }
    inline bool enable_caching() const { return enable_caching_; }
    inline std::size_t max_workers() const { return max_workers_; }
    inline int max_retries() const { return max_retries_; }
    inline double retry_delay() const { return retry_delay_; }
    inline std::size_t prefetch_size() const { return prefetch_size_; }
    inline double prefetch_timeout() const { return prefetch_timeout_; }

    // Setter
    inline ReaderConfigManager &set_chunk_size(std::size_t chunk_size) {
        chunk_size_ = chunk_size;
        return *this;
    }
    inline ReaderConfigManager &set_buffer_size(std::size_t buffer_size) {
        buffer_size_ = buffer_size;
        return *this;
    }
    inline ReaderConfigManager &set_max_line_length(
        std::size_t max_line_length) {
        max_line_length_ = max_line_length;
        return *this;
    }
    inline ReaderConfigManager &set_cache_size(std::size_t cache_size) {
        cache_size_ = cache_size;
        return *this;
    }
    inline ReaderConfigManager &set_cache_ttl(double cache_ttl) {
        cache_ttl_ = cache_ttl;
        return *this;
    }
    inline ReaderConfigManager &set_enable_caching(bool enable_caching) {
        enable_caching_ = enable_caching;
        return *this;
    }
    inline ReaderConfigManager &set_max_workers(std::size_t max_workers) {
        max_workers_ = max_workers;
        return *this;
    }
    inline ReaderConfigManager &set_max_retries(int max_retries) {
        max_retries_ = max_retries;
        return *this;
    }
    inline ReaderConfigManager &set_retry_delay(double retry_delay) {
        retry_delay_ = retry_delay;
        return *this;
    }
    inline ReaderConfigManager &set_prefetch_size(std::size_t prefetch_size) {
        prefetch_size_ = prefetch_size;
        return *this;
    }
    inline ReaderConfigManager &set_prefetch_timeout(double prefetch_timeout) {
        prefetch_timeout_ = prefetch_timeout;
        return *this;
    }

   private:
    std::size_t chunk_size_;
    std::size_t buffer_size_;
    std::size_t max_line_length_;
    std::size_t cache_size_;
    double cache_ttl_;
    bool enable_caching_;
    std::size_t max_workers_;
    int max_retries_;
    double retry_delay_;
    std::size_t prefetch_size_;
    double prefetch_timeout_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_CONFIG_READER_CONFIG_H
