#include <buildlog/utils/parallel/parallel_chunk_iterator.h>

namespace buildlog::utils {

ParallelChunkIterator::ParallelChunkIterator(ParallelReader &reader)
    : reader_(reader), index_(0), loaded_(false) {}

bool ParallelChunkIterator::next(std::string &chunk) {
    if (!loaded_) {
        if (reader_.state() != ParallelReader::State::Initialized) {
            reader_.initialize();
        }
        results_ = reader_.read_chunks();
        index_ = 0;
        loaded_ = true;
    }
    if (index_ >= results_.size()) {
        return false;
    }
    chunk = results_[index_].content;
    ++index_;
    return true;
}

void ParallelChunkIterator::reset() {
    results_.clear();
    index_ = 0;
    loaded_ = false;
}

void ParallelChunkIterator::close() {
    reset();
    reader_.close();
}

const ReadResult *ParallelChunkIterator::current() const {
    if (index_ == 0 || index_ > results_.size()) {
        return nullptr;
    }
    return &results_[index_ - 1];
}

}  // namespace buildlog::utils
