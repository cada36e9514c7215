#ifndef BUILDLOG_UTILS_PARALLEL_PARALLEL_CHUNK_ITERATOR_H
#define BUILDLOG_UTILS_PARALLEL_PARALLEL_CHUNK_ITERATOR_H

#include <buildlog/utils/iterators/iterator.h>
#include <buildlog/utils/parallel/parallel_reader.h>

#include <cstddef>
#include <string>
#include <vector>

namespace buildlog::utils {

/**
 * Iterator over the contents of a ParallelReader session, in file order.
 * The first next() initializes the reader if needed and reads every chunk;
 * reset() makes the following next() read the file again.
 */
class ParallelChunkIterator : public Iterator<std::string> {
   public:
    explicit ParallelChunkIterator(ParallelReader &reader);

    bool next(std::string &chunk) override;
    void reset() override;
    void close() override;

    // Result of the chunk most recently returned by next()
    const ReadResult *current() const;

   private:
    ParallelReader &reader_;
    std::vector<ReadResult> results_;
    std::size_t index_;
    bool loaded_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_PARALLEL_PARALLEL_CHUNK_ITERATOR_H
