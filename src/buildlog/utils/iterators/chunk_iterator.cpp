#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/iterators/chunk_iterator.h>

#include <algorithm>

#include "source_access.h"

namespace buildlog::utils {

std::size_t ChunkIterator::auto_chunk_size(std::uint64_t file_size) {
    std::uint64_t size = file_size / constants::iterators::AUTO_CHUNK_DIVISOR;
    size = std::max<std::uint64_t>(size,
                                   constants::iterators::MIN_AUTO_CHUNK_SIZE);
    size = std::min<std::uint64_t>(size,
                                   constants::iterators::MAX_AUTO_CHUNK_SIZE);
    return static_cast<std::size_t>(size);
}

ChunkIterator::ChunkIterator(FileSource &source, std::size_t chunk_size)
    : source_(source), chunk_size_(chunk_size) {
    if (chunk_size_ == 0) {
        try {
            chunk_size_ = auto_chunk_size(source_.size());
        } catch (const ReaderError &e) {
            BUILDLOG_UTILS_LOG_DEBUG(
                "Size of %s unknown (%s), using minimum chunk size",
                source_.get_path().c_str(), e.what());
            chunk_size_ = constants::iterators::MIN_AUTO_CHUNK_SIZE;
        }
    }
    open_source(source_);
    BUILDLOG_UTILS_LOG_DEBUG("Chunk iterator over %s with chunk size %zu",
                             source_.get_path().c_str(), chunk_size_);
}

bool ChunkIterator::next(std::string &chunk) {
    while (true) {
        std::string data = read_source(source_, chunk_size_);
        if (data.empty()) {
            if (remainder_.empty()) {
                return false;
            }
            chunk.swap(remainder_);
            remainder_.clear();
            return true;
        }

        // remainder_ never holds a newline, only the new data can
        std::size_t pos = data.rfind('\n');
        if (pos == std::string::npos) {
            remainder_.append(data);
            continue;
        }

        chunk.swap(remainder_);
        chunk.append(data, 0, pos + 1);
        remainder_.assign(data, pos + 1, std::string::npos);
        return true;
    }
}

void ChunkIterator::seek(std::uint64_t position) {
    remainder_.clear();
    seek_source(source_, position);
}

void ChunkIterator::reset() { seek(0); }

void ChunkIterator::close() {
    remainder_.clear();
    source_.close();
}

std::uint64_t ChunkIterator::tell() const {
    try {
        return source_.tell();
    } catch (const ReaderError &e) {
        throw as_read_error(e);
    }
}

}  // namespace buildlog::utils
