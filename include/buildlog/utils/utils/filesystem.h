#ifndef BUILDLOG_UTILS_UTILS_FILESYSTEM_H
#define BUILDLOG_UTILS_UTILS_FILESYSTEM_H

#include <filesystem>

namespace fs = std::filesystem;

#endif  // BUILDLOG_UTILS_UTILS_FILESYSTEM_H
