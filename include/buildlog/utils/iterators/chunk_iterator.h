#ifndef BUILDLOG_UTILS_ITERATORS_CHUNK_ITERATOR_H
#define BUILDLOG_UTILS_ITERATORS_CHUNK_ITERATOR_H

#include <buildlog/utils/iterators/iterator.h>
#include <buildlog/utils/reader/file_source.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace buildlog::utils {

/**
 * Reads a FileSource in chunks that end on a line boundary.
 *
 * Each chunk holds whole lines only. A line longer than the chunk size is
 * accumulated across reads and returned in one piece, so a chunk can be
 * larger than chunk_size. The unterminated tail of the source is returned
 * as-is. The source is not owned and must outlive the iterator.
 */
class ChunkIterator : public Iterator<std::string> {
   public:
    /**
     * @param chunk_size bytes per read; 0 selects file_size / 1000 clamped
     * to [64KiB, 256KiB]
     */
    explicit ChunkIterator(FileSource &source, std::size_t chunk_size = 0);

    bool next(std::string &chunk) override;
    void reset() override;
    void close() override;

    // Discard buffered data and continue from an absolute position
    void seek(std::uint64_t position);

    // Source position after the last read
    std::uint64_t tell() const;

    std::size_t chunk_size() const { return chunk_size_; }

    static std::size_t auto_chunk_size(std::uint64_t file_size);

   private:
    FileSource &source_;
    std::size_t chunk_size_;
    std::string remainder_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_ITERATORS_CHUNK_ITERATOR_H
