#ifndef BUILDLOG_UTILS_ITERATORS_SOURCE_ACCESS_H
#define BUILDLOG_UTILS_ITERATORS_SOURCE_ACCESS_H

#include <buildlog/utils/reader/error.h>
#include <buildlog/utils/reader/file_source.h>

#include <cstdint>
#include <string>

namespace buildlog::utils {

// Iterators report every source failure as READ_ERROR
inline ReaderError as_read_error(const ReaderError &e) {
    if (e.get_type() == ReaderError::READ_ERROR) {
        return e;
    }
    return ReaderError(ReaderError::READ_ERROR, e.get_message());
}

inline void open_source(FileSource &source) {
    try {
        if (!source.is_open()) {
            source.open();
        }
    } catch (const ReaderError &e) {
        throw as_read_error(e);
    }
}

inline std::string read_source(FileSource &source, std::size_t size) {
    try {
        return source.read(static_cast<std::int64_t>(size));
    } catch (const ReaderError &e) {
        throw as_read_error(e);
    }
}

inline std::uint64_t seek_source(FileSource &source, std::uint64_t position) {
    try {
        open_source(source);
        return source.seek(static_cast<std::int64_t>(position), SEEK_SET);
    } catch (const ReaderError &e) {
        throw as_read_error(e);
    }
}

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_ITERATORS_SOURCE_ACCESS_H
