#ifndef BUILDLOG_UTILS_ITERATORS_ITERATOR_H
#define BUILDLOG_UTILS_ITERATORS_ITERATOR_H

namespace buildlog::utils {

/**
 * Pull-style producer. next() fills item and returns true, or returns false
 * once the sequence is exhausted.
 */
template <typename T>
class Iterator {
   public:
    virtual ~Iterator() = default;

    virtual bool next(T &item) = 0;

    // Rewind to the start of the sequence
    virtual void reset() = 0;

    virtual void close() {}
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_ITERATORS_ITERATOR_H
