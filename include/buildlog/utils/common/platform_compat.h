#ifndef BUILDLOG_UTILS_COMMON_PLATFORM_COMPAT_H
#define BUILDLOG_UTILS_COMMON_PLATFORM_COMPAT_H

// Large-file stdio access for log sources

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>

#define fseeko _fseeki64
#define ftello _ftelli64
#define fileno _fileno

#ifndef _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
#endif

#else
#include <sys/types.h>
#include <unistd.h>

#ifndef _FILE_OFFSET_BITS
#define _FILE_OFFSET_BITS 64
#endif

#ifndef _LARGEFILE64_SOURCE
#define _LARGEFILE64_SOURCE
#endif

#endif

namespace buildlog::utils {

// Offset type accepted by fseeko and returned by ftello
#ifdef _WIN32
using file_offset_t = __int64;
#else
using file_offset_t = off_t;
#endif

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_COMMON_PLATFORM_COMPAT_H
