#include <buildlog/utils/common/constants.h>
#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/common/platform_compat.h>
#include <buildlog/utils/reader/file_source.h>
#include <buildlog/utils/utils/filesystem.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

#include "inflater.h"

#ifdef __linux__
#include <fcntl.h>
#endif

namespace buildlog::utils {

namespace {

FILE *open_file(const std::string &path) {
    FILE *file = fopen(path.c_str(), "rb");
    if (!file) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            throw ReaderError(ReaderError::PERMISSION_DENIED,
                              "Permission denied: " + path);
        }
        if (err == ENOENT) {
            throw ReaderError(ReaderError::NOT_FOUND,
                              "File not found: " + path);
        }
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to open file: " + path + " (" +
                              std::strerror(err) + ")");
    }

    setvbuf(file, nullptr, _IOFBF, constants::reader::FILE_IO_BUFFER_SIZE);

#ifdef __linux__
    // Hint to kernel about sequential access
    int fd = fileno(file);
    posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif

    return file;
}

void validate_read_size(std::int64_t size) {
    if (size < 0) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Read size must be non-negative, got " +
                              std::to_string(size));
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// FileSource
// ---------------------------------------------------------------------------

FileSource::FileSource(const std::string &path)
    : path_(path), is_open_(false) {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        throw ReaderError(ReaderError::NOT_FOUND, "File not found: " + path_);
    }
    if (!fs::is_regular_file(path_, ec)) {
        throw ReaderError(ReaderError::FORMAT_ERROR,
                          "Not a regular file: " + path_);
    }
}

std::string FileSource::read_all() {
    std::string result;
    std::string block;
    do {
        block = read(static_cast<std::int64_t>(
            constants::reader::FILE_IO_BUFFER_SIZE));
        result.append(block);
    } while (!block.empty());
    return result;
}

std::uint64_t FileSource::size() const {
    std::error_code ec;
    auto file_size = fs::file_size(path_, ec);
    if (ec) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to stat file: " + path_ + " (" +
                              ec.message() + ")");
    }
    return static_cast<std::uint64_t>(file_size);
}

void FileSource::ensure_open(const char *operation) const {
    if (!is_open_) {
        throw ReaderError(ReaderError::READ_ERROR,
                          std::string(operation) +
                              " on a closed source: " + path_);
    }
}

// ---------------------------------------------------------------------------
// TextFileSource
// ---------------------------------------------------------------------------

TextFileSource::TextFileSource(const std::string &path)
    : FileSource(path), file_handle_(nullptr) {}

TextFileSource::~TextFileSource() { close(); }

void TextFileSource::open() {
    if (is_open_) {
        return;
    }
    file_handle_ = open_file(path_);
    is_open_ = true;
    BUILDLOG_UTILS_LOG_DEBUG("Opened text source %s", path_.c_str());
}

void TextFileSource::close() {
    if (file_handle_) {
        fclose(file_handle_);
        file_handle_ = nullptr;
    }
    is_open_ = false;
}

std::string TextFileSource::read(std::int64_t size) {
    ensure_open("read");
    validate_read_size(size);

    std::string data(static_cast<std::size_t>(size), '\0');
    std::size_t n = ::fread(data.data(), 1, data.size(), file_handle_);
    if (n < data.size() && std::ferror(file_handle_)) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to read from " + path_ + ": " +
                              std::strerror(errno));
    }
    data.resize(n);
    return data;
}

std::uint64_t TextFileSource::seek(std::int64_t offset, int whence) {
    ensure_open("seek");
    if (whence != SEEK_SET && whence != SEEK_CUR && whence != SEEK_END) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Invalid whence value: " + std::to_string(whence));
    }
    if (fseeko(file_handle_, static_cast<file_offset_t>(offset), whence) != 0) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to seek in " + path_ + " to offset " +
                              std::to_string(offset) + ": " +
                              std::strerror(errno));
    }
    return tell();
}

std::uint64_t TextFileSource::tell() const {
    ensure_open("tell");
    file_offset_t position = ftello(file_handle_);
    if (position < 0) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to query position in " + path_);
    }
    return static_cast<std::uint64_t>(position);
}

// ---------------------------------------------------------------------------
// GzipFileSource
// ---------------------------------------------------------------------------

GzipFileSource::GzipFileSource(const std::string &path)
    : FileSource(path), file_handle_(nullptr), position_(0) {
    if (!is_gzip_file(path_)) {
        throw ReaderError(ReaderError::FORMAT_ERROR,
                          "Not a valid gzip file: " + path_);
    }
}

GzipFileSource::~GzipFileSource() { close(); }

bool GzipFileSource::is_gzip_file(const std::string &path) {
    FILE *file = fopen(path.c_str(), "rb");
    if (!file) {
        return false;
    }
    unsigned char magic[2] = {0, 0};
    std::size_t n = ::fread(magic, 1, sizeof(magic), file);
    fclose(file);
    return n == sizeof(magic) && magic[0] == 0x1f && magic[1] == 0x8b;
}

void GzipFileSource::open() {
    if (is_open_) {
        return;
    }
    file_handle_ = open_file(path_);
    inflater_ = std::make_unique<Inflater>();
    is_open_ = true;
    try {
        restart();
    } catch (...) {
        close();
        throw;
    }
    BUILDLOG_UTILS_LOG_DEBUG("Opened gzip source %s", path_.c_str());
}

void GzipFileSource::close() {
    inflater_.reset();
    if (file_handle_) {
        fclose(file_handle_);
        file_handle_ = nullptr;
    }
    position_ = 0;
    is_open_ = false;
}

void GzipFileSource::restart() {
    if (!inflater_->initialize(file_handle_,
                               constants::reader::ZLIB_GZIP_WINDOW_BITS)) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Failed to initialize inflater for " + path_);
    }
    position_ = 0;
}

std::size_t GzipFileSource::inflate_into(char *out, std::size_t size) {
    std::size_t bytes_read = 0;
    if (!inflater_->read(file_handle_, reinterpret_cast<unsigned char *>(out),
                         size, bytes_read)) {
        if (inflater_->last_status == Z_ERRNO) {
            throw ReaderError(ReaderError::READ_ERROR,
                              "Failed to read compressed data from " + path_);
        }
        throw ReaderError(ReaderError::FORMAT_ERROR,
                          "Corrupt gzip stream in " + path_ + " (zlib status " +
                              std::to_string(inflater_->last_status) + ")");
    }
    position_ += bytes_read;
    return bytes_read;
}

std::string GzipFileSource::read(std::int64_t size) {
    ensure_open("read");
    validate_read_size(size);

    std::string data(static_cast<std::size_t>(size), '\0');
    std::size_t total = 0;
    while (total < data.size()) {
        std::size_t n = inflate_into(data.data() + total, data.size() - total);
        if (n == 0) {
            break;
        }
        total += n;
    }
    data.resize(total);
    return data;
}

void GzipFileSource::skip(std::uint64_t bytes) {
    std::vector<char> skip_buffer(constants::reader::SKIP_BUFFER_SIZE);
    while (bytes > 0) {
        std::size_t to_skip = static_cast<std::size_t>(
            std::min<std::uint64_t>(bytes, skip_buffer.size()));
        std::size_t n = inflate_into(skip_buffer.data(), to_skip);
        if (n == 0) {
            break;
        }
        bytes -= n;
    }
}

std::uint64_t GzipFileSource::seek(std::int64_t offset, int whence) {
    ensure_open("seek");
    std::int64_t target;
    switch (whence) {
        case SEEK_SET:
            target = offset;
            break;
        case SEEK_CUR:
            target = static_cast<std::int64_t>(position_) + offset;
            break;
        case SEEK_END:
            throw ReaderError(ReaderError::VALIDATION_ERROR,
                              "SEEK_END is not supported on gzip sources");
        default:
            throw ReaderError(ReaderError::VALIDATION_ERROR,
                              "Invalid whence value: " +
                                  std::to_string(whence));
    }
    if (target < 0) {
        throw ReaderError(ReaderError::READ_ERROR,
                          "Cannot seek before the start of " + path_);
    }

    std::uint64_t destination = static_cast<std::uint64_t>(target);
    if (destination < position_) {
        BUILDLOG_UTILS_LOG_DEBUG(
            "Restarting decompression of %s for backward seek to %llu",
            path_.c_str(), static_cast<unsigned long long>(destination));
        restart();
    }
    skip(destination - position_);
    return position_;
}

std::uint64_t GzipFileSource::tell() const {
    ensure_open("tell");
    return position_;
}

}  // namespace buildlog::utils
