#ifndef BUILDLOG_UTILS_CACHE_SIZE_OF_H
#define BUILDLOG_UTILS_CACHE_SIZE_OF_H

#include <cstddef>
#include <map>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace buildlog::utils::cache {

// Approximate in-memory footprint of a cached value, counting the payload
// of nested containers.
template <typename T>
typename std::enable_if<std::is_arithmetic<T>::value, std::size_t>::type
size_of(const T &) {
    return sizeof(T);
}

// Any other type counts its object size only
template <typename T>
typename std::enable_if<!std::is_arithmetic<T>::value, std::size_t>::type
size_of(const T &) {
    return sizeof(T);
}

inline std::size_t size_of(const std::string &value) {
    return sizeof(std::string) + value.size();
}

template <typename T>
std::size_t size_of(const std::vector<T> &values);
template <typename K, typename V>
std::size_t size_of(const std::map<K, V> &values);
template <typename K, typename V>
std::size_t size_of(const std::unordered_map<K, V> &values);

template <typename T>
std::size_t size_of(const std::vector<T> &values) {
    if (std::is_arithmetic<T>::value) {
        return sizeof(std::vector<T>) + values.size() * sizeof(T);
    }
    std::size_t total = sizeof(std::vector<T>);
    for (const auto &value : values) {
        total += size_of(value);
    }
    return total;
}

template <typename K, typename V>
std::size_t size_of(const std::map<K, V> &values) {
    std::size_t total = sizeof(std::map<K, V>);
    for (const auto &entry : values) {
        total += size_of(entry.first) + size_of(entry.second);
    }
    return total;
}

template <typename K, typename V>
std::size_t size_of(const std::unordered_map<K, V> &values) {
    std::size_t total = sizeof(std::unordered_map<K, V>);
    for (const auto &entry : values) {
        total += size_of(entry.first) + size_of(entry.second);
    }
    return total;
}

}  // namespace buildlog::utils::cache

#endif  // BUILDLOG_UTILS_CACHE_SIZE_OF_H
