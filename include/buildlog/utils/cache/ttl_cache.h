#ifndef BUILDLOG_UTILS_CACHE_TTL_CACHE_H
#define BUILDLOG_UTILS_CACHE_TTL_CACHE_H

#include <buildlog/utils/cache/cache_strategy.h>
#include <buildlog/utils/common/constants.h>

#include <chrono>
#include <unordered_map>

namespace buildlog::utils::cache {

/**
 * Entries expire ttl seconds after their last put(). Expired entries are
 * dropped lazily: on get(), get_size(), get_bytes() and keys().
 * evict_one() prefers an expired entry, else the one expiring soonest.
 */
template <typename V>
class TTLCache : public CacheStrategy<V> {
   public:
    using Clock = std::chrono::steady_clock;

    explicit TTLCache(double ttl_seconds = constants::cache::DEFAULT_TTL)
        : ttl_(std::chrono::duration_cast<Clock::duration>(
              std::chrono::duration<double>(ttl_seconds))),
          bytes_(0) {}

    std::optional<V> get(const std::string &key) override {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (is_expired(it->second, Clock::now())) {
            erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    bool contains(const std::string &key) override {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        if (is_expired(it->second, Clock::now())) {
            erase(it);
            return false;
        }
        return true;
    }

    void put(const std::string &key, V value, std::size_t size) override {
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            erase(it);
        }
        entries_.emplace(key, Entry{std::move(value), size,
                                    Clock::now() + ttl_});
        bytes_ += size;
    }

    bool remove(const std::string &key) override {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        erase(it);
        return true;
    }

    void clear() override {
        entries_.clear();
        bytes_ = 0;
    }

    std::size_t get_size() override {
        purge_expired();
        return entries_.size();
    }

    std::size_t get_bytes() override {
        purge_expired();
        return bytes_;
    }

    bool evict_one() override {
        if (entries_.empty()) {
            return false;
        }
        auto now = Clock::now();
        auto victim = entries_.begin();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (is_expired(it->second, now)) {
                victim = it;
                break;
            }
            if (it->second.expiry < victim->second.expiry) {
                victim = it;
            }
        }
        erase(victim);
        return true;
    }

    std::vector<std::string> keys() override {
        purge_expired();
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto &entry : entries_) {
            result.push_back(entry.first);
        }
        return result;
    }

    double ttl_seconds() const {
        return std::chrono::duration<double>(ttl_).count();
    }

   private:
    struct Entry {
        V value;
        std::size_t size;
        Clock::time_point expiry;
    };
    using Map = std::unordered_map<std::string, Entry>;

    static bool is_expired(const Entry &entry, Clock::time_point now) {
        return now > entry.expiry;
    }

    typename Map::iterator erase(typename Map::iterator it) {
        bytes_ -= it->second.size;
        return entries_.erase(it);
    }

    void purge_expired() {
        auto now = Clock::now();
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (is_expired(it->second, now)) {
                it = erase(it);
            } else {
                ++it;
            }
        }
    }

    Clock::duration ttl_;
    Map entries_;
    std::size_t bytes_;
};

}  // namespace buildlog::utils::cache

#endif  // BUILDLOG_UTILS_CACHE_TTL_CACHE_H
