#ifndef BUILDLOG_UTILS_PARALLEL_CHUNK_H
#define BUILDLOG_UTILS_PARALLEL_CHUNK_H

#include <buildlog/utils/common/typedefs.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace buildlog::utils {

// Byte range of a file assigned to one parallel task
struct Chunk {
    std::string file_path;
    std::uint64_t start_offset = 0;
    std::size_t size = 0;
    TaskIndex chunk_id = 0;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_PARALLEL_CHUNK_H
