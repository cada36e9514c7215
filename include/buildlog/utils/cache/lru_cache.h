#ifndef BUILDLOG_UTILS_CACHE_LRU_CACHE_H
#define BUILDLOG_UTILS_CACHE_LRU_CACHE_H

#include <buildlog/utils/cache/cache_strategy.h>

#include <list>
#include <unordered_map>

namespace buildlog::utils::cache {

/**
 * Least-recently-used order. get() and put() make a key the most recent;
 * evict_one() drops the least recent.
 */
template <typename V>
class LRUCache : public CacheStrategy<V> {
   public:
    LRUCache() : bytes_(0) {}

    std::optional<V> get(const std::string &key) override {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->value;
    }

    bool contains(const std::string &key) override {
        return index_.count(key) > 0;
    }

    void put(const std::string &key, V value, std::size_t size) override {
        auto it = index_.find(key);
        if (it != index_.end()) {
            bytes_ -= it->second->size;
            it->second->value = std::move(value);
            it->second->size = size;
            bytes_ += size;
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }
        entries_.push_front(Entry{key, std::move(value), size});
        index_[key] = entries_.begin();
        bytes_ += size;
    }

    bool remove(const std::string &key) override {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        bytes_ -= it->second->size;
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    void clear() override {
        entries_.clear();
        index_.clear();
        bytes_ = 0;
    }

    std::size_t get_size() override { return entries_.size(); }
    std::size_t get_bytes() override { return bytes_; }

    bool evict_one() override {
        if (entries_.empty()) {
            return false;
        }
        const Entry &oldest = entries_.back();
        bytes_ -= oldest.size;
        index_.erase(oldest.key);
        entries_.pop_back();
        return true;
    }

    // Most recent first
    std::vector<std::string> keys() override {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto &entry : entries_) {
            result.push_back(entry.key);
        }
        return result;
    }

   private:
    struct Entry {
        std::string key;
        V value;
        std::size_t size;
    };

    std::list<Entry> entries_;
    std::unordered_map<std::string, typename std::list<Entry>::iterator>
        index_;
    std::size_t bytes_;
};

}  // namespace buildlog::utils::cache

#endif  // BUILDLOG_UTILS_CACHE_LRU_CACHE_H
