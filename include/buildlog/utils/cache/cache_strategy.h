#ifndef BUILDLOG_UTILS_CACHE_CACHE_STRATEGY_H
#define BUILDLOG_UTILS_CACHE_CACHE_STRATEGY_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace buildlog::utils::cache {

/**
 * Storage and eviction order for a CacheManager. Each entry carries the
 * byte size the manager computed for it; the strategy keeps the running
 * total so entries it drops on its own (expiry) are accounted for.
 *
 * Implementations are not thread-safe; the manager serializes access.
 */
template <typename V>
class CacheStrategy {
   public:
    virtual ~CacheStrategy() = default;

    virtual std::optional<V> get(const std::string &key) = 0;
    virtual bool contains(const std::string &key) = 0;

    // Insert or replace
    virtual void put(const std::string &key, V value, std::size_t size) = 0;

    virtual bool remove(const std::string &key) = 0;
    virtual void clear() = 0;

    // Number of live entries
    virtual std::size_t get_size() = 0;

    // Sum of the sizes of live entries
    virtual std::size_t get_bytes() = 0;

    /**
     * Drop one entry chosen by the policy
     * @return false if there was nothing to evict
     */
    virtual bool evict_one() = 0;

    virtual std::vector<std::string> keys() = 0;
};

}  // namespace buildlog::utils::cache

#endif  // BUILDLOG_UTILS_CACHE_CACHE_STRATEGY_H
