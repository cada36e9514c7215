#ifndef BUILDLOG_UTILS_READER_READ_RESULT_H
#define BUILDLOG_UTILS_READER_READ_RESULT_H

#include <buildlog/utils/common/typedefs.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace buildlog::utils {

struct ReadResult {
    std::string content;
    std::uint64_t position = 0;
    std::size_t size = 0;
    bool is_eof = false;
    // chunk_id, original_size, worker_id, attempts
    Metadata metadata;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_READER_READ_RESULT_H
