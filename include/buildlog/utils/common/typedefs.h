#ifndef BUILDLOG_UTILS_COMMON_TYPEDEFS_H
#define BUILDLOG_UTILS_COMMON_TYPEDEFS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace buildlog::utils {

typedef std::size_t TaskIndex;
typedef int WorkerId;
typedef std::map<std::string, std::string> Metadata;

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_COMMON_TYPEDEFS_H
