#ifndef BUILDLOG_UTILS_READER_INFLATER_H
#define BUILDLOG_UTILS_READER_INFLATER_H

#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/common/platform_compat.h>
#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>

namespace buildlog::utils {

class Inflater {
   public:
    static constexpr std::size_t BUFFER_SIZE =
        constants::reader::GZIP_BUFFER_SIZE;
    z_stream stream;
    // zlib status of the last read; Z_ERRNO when the file itself failed
    int last_status;
    bool finished;
    bool between_members;
    alignas(64) unsigned char in_buffer[BUFFER_SIZE];

   public:
    // avail_out is a uInt, so a read is fed to zlib in windows of at most
    // max_window bytes
    explicit Inflater(
        std::size_t max_window = std::numeric_limits<uInt>::max())
        : last_status(Z_OK),
          finished(false),
          between_members(false),
          max_window_(std::max<std::size_t>(
              std::min<std::size_t>(max_window,
                                    std::numeric_limits<uInt>::max()),
              1)),
          initialized_(false) {
        std::memset(&stream, 0, sizeof(stream));
    }

    ~Inflater() { reset(); }

    Inflater(const Inflater &) = delete;
    Inflater &operator=(const Inflater &) = delete;

    bool initialize(FILE *file,
                    int bits = constants::reader::ZLIB_GZIP_WINDOW_BITS) {
        reset();
        if (inflateInit2(&stream, bits) != Z_OK) {
            return false;
        }
        initialized_ = true;
        if (fseeko(file, 0, SEEK_SET) != 0) {
            last_status = Z_ERRNO;
            return false;
        }
        stream.avail_in = 0;
        stream.next_in = nullptr;
        last_status = Z_OK;
        finished = false;
        between_members = false;
        return true;
    }

    void reset() {
        if (initialized_) {
            inflateEnd(&stream);
            initialized_ = false;
        }
        std::memset(&stream, 0, sizeof(stream));
        finished = false;
        between_members = false;
    }

    bool read(FILE *file, unsigned char *buf, std::size_t len,
              std::size_t &bytes_out) {
        std::size_t unassigned = len;
        stream.next_out = buf;
        stream.avail_out = 0;
        bytes_out = 0;

        while (!finished) {
            if (stream.avail_out == 0) {
                if (unassigned == 0) {
                    break;
                }
                std::size_t window = std::min(unassigned, max_window_);
                stream.avail_out = static_cast<uInt>(window);
                unassigned -= window;
            }
            if (stream.avail_in == 0) {
                std::size_t n = ::fread(in_buffer, 1, sizeof(in_buffer), file);
                if (n == 0) {
                    if (std::ferror(file)) {
                        BUILDLOG_UTILS_LOG_DEBUG(
                            "Error reading from file during inflation with "
                            "error: %s",
                            std::strerror(errno));
                        last_status = Z_ERRNO;
                        return false;
                    }
                    if (between_members) {
                        finished = true;
                        break;
                    }
                    // End of file in the middle of a gzip member
                    BUILDLOG_UTILS_LOG_DEBUG(
                        "Unexpected end of compressed data after %lu bytes",
                        static_cast<unsigned long>(stream.total_out));
                    last_status = Z_DATA_ERROR;
                    return false;
                }
                stream.next_in = in_buffer;
                stream.avail_in = static_cast<uInt>(n);
            }
            between_members = false;
            int ret = inflate(&stream, Z_NO_FLUSH);

            if (ret == Z_STREAM_END) {
                // Concatenated gzip members continue in the same stream
                if (stream.avail_in > 0 || !std::feof(file)) {
                    if (inflateReset(&stream) != Z_OK) {
                        last_status = Z_STREAM_ERROR;
                        return false;
                    }
                    between_members = true;
                    continue;
                }
                finished = true;
                break;
            }
            if (ret != Z_OK) {
                BUILDLOG_UTILS_LOG_DEBUG(
                    "inflate() failed with error: %d (%s)", ret,
                    stream.msg ? stream.msg : "no message");
                last_status = ret;
                return false;
            }
        }

        bytes_out = len - unassigned - stream.avail_out;
        last_status = Z_OK;
        return true;
    }

    std::size_t max_window() const { return max_window_; }

   private:
    std::size_t max_window_;
    bool initialized_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_READER_INFLATER_H
