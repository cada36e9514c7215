#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/iterators/line_iterator.h>

#include "source_access.h"

namespace buildlog::utils {

LineIterator::LineIterator(FileSource &source, std::size_t buffer_size,
                           std::size_t max_line_length)
    : source_(source),
      buffer_size_(buffer_size),
      max_line_length_(max_line_length),
      offset_(0),
      scan_from_(0),
      line_number_(0),
      eof_(false) {
    if (buffer_size_ == 0 || max_line_length_ == 0) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Line iterator buffer_size and max_line_length "
                          "must be positive");
    }
    open_source(source_);
}

void LineIterator::emit(std::string &line, std::size_t length) {
    line.assign(buffer_, offset_, length);
    offset_ += length;
    ++line_number_;
}

bool LineIterator::next(std::string &line) {
    while (true) {
        std::size_t pending = buffer_.size() - offset_;
        std::size_t pos = buffer_.find('\n', scan_from_);
        if (pos != std::string::npos && pos - offset_ < max_line_length_) {
            emit(line, pos + 1 - offset_);
            scan_from_ = offset_;
            return true;
        }

        if (pending >= max_line_length_) {
            BUILDLOG_UTILS_LOG_DEBUG(
                "Line %zu in %s exceeds %zu bytes, splitting", line_number_ + 1,
                source_.get_path().c_str(), max_line_length_);
            emit(line, max_line_length_);
            scan_from_ = pos == std::string::npos ? buffer_.size() : offset_;
            return true;
        }

        if (eof_) {
            if (pending == 0) {
                return false;
            }
            emit(line, pending);
            scan_from_ = offset_;
            return true;
        }

        std::string data = read_source(source_, buffer_size_);
        if (data.empty()) {
            eof_ = true;
            scan_from_ = buffer_.size();
            continue;
        }
        // Drop consumed lines only when refilling
        buffer_.erase(0, offset_);
        offset_ = 0;
        scan_from_ = buffer_.size();
        buffer_.append(data);
    }
}

void LineIterator::seek(std::uint64_t position) {
    buffer_.clear();
    offset_ = 0;
    scan_from_ = 0;
    line_number_ = 0;
    eof_ = false;
    seek_source(source_, position);
}

void LineIterator::reset() { seek(0); }

void LineIterator::close() {
    buffer_.clear();
    offset_ = 0;
    scan_from_ = 0;
    source_.close();
}

}  // namespace buildlog::utils
