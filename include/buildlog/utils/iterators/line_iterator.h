#ifndef BUILDLOG_UTILS_ITERATORS_LINE_ITERATOR_H
#define BUILDLOG_UTILS_ITERATORS_LINE_ITERATOR_H

#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/iterators/iterator.h>
#include <buildlog/utils/reader/file_source.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace buildlog::utils {

/**
 * Yields one line per call, terminator included.
 *
 * A line that reaches max_line_length bytes without a terminator is split
 * at exactly that length. Lines are returned exactly as they appear in the
 * source: split fragments and an unterminated last line carry no added
 * newline, so the concatenated output equals the source.
 */
class LineIterator : public Iterator<std::string> {
   public:
    LineIterator(
        FileSource &source,
        std::size_t buffer_size = constants::reader::DEFAULT_BUFFER_SIZE,
        std::size_t max_line_length =
            constants::reader::DEFAULT_MAX_LINE_LENGTH);

    bool next(std::string &line) override;
    void reset() override;
    void close() override;

    // Restart from an absolute position; the line counter starts over
    void seek(std::uint64_t position);

    // Number of lines returned since construction or the last reset/seek
    std::size_t line_number() const { return line_number_; }

    std::size_t buffer_size() const { return buffer_size_; }
    std::size_t max_line_length() const { return max_line_length_; }

   private:
    void emit(std::string &line, std::size_t length);

    FileSource &source_;
    std::size_t buffer_size_;
    std::size_t max_line_length_;
    std::string buffer_;
    // Start of the unread part of buffer_
    std::size_t offset_;
    // buffer_[offset_, scan_from_) is known to hold no newline
    std::size_t scan_from_;
    std::size_t line_number_;
    bool eof_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_ITERATORS_LINE_ITERATOR_H
