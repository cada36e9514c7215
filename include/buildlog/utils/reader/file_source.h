#ifndef BUILDLOG_UTILS_READER_FILE_SOURCE_H
#define BUILDLOG_UTILS_READER_FILE_SOURCE_H

#include <buildlog/utils/reader/error.h>

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

namespace buildlog::utils {

/**
 * Readable byte source over a local file.
 *
 * All operations other than open() and close() require the source to be
 * open and fail with ReaderError::READ_ERROR otherwise. A read that returns
 * an empty string means end of data.
 */
class FileSource {
   public:
    explicit FileSource(const std::string &path);
    virtual ~FileSource() = default;

    FileSource(const FileSource &) = delete;
    FileSource &operator=(const FileSource &) = delete;

    virtual void open() = 0;
    virtual void close() = 0;

    /**
     * Read up to size bytes from the current position
     * @throws ReaderError VALIDATION_ERROR if size is negative
     */
    virtual std::string read(std::int64_t size) = 0;

    /**
     * Read everything from the current position to the end of data
     */
    virtual std::string read_all();

    /**
     * Move the read position
     * @param whence SEEK_SET, SEEK_CUR or SEEK_END
     * @return new absolute position
     */
    virtual std::uint64_t seek(std::int64_t offset, int whence = SEEK_SET) = 0;
    virtual std::uint64_t tell() const = 0;

    /**
     * Size of the file on disk in bytes
     */
    std::uint64_t size() const;

    bool is_open() const { return is_open_; }
    const std::string &get_path() const { return path_; }

    /**
     * Short identifier of the implementation ("text", "gzip", ...)
     */
    virtual const char *kind() const = 0;

   protected:
    void ensure_open(const char *operation) const;

    std::string path_;
    bool is_open_;
};

class TextFileSource : public FileSource {
   public:
    explicit TextFileSource(const std::string &path);
    ~TextFileSource() override;

    void open() override;
    void close() override;
    std::string read(std::int64_t size) override;
    std::uint64_t seek(std::int64_t offset, int whence = SEEK_SET) override;
    std::uint64_t tell() const override;
    const char *kind() const override { return "text"; }

   private:
    FILE *file_handle_;
};

class Inflater;

/**
 * Decompressing source for gzip files. Positions are offsets into the
 * uncompressed stream; a backward seek restarts decompression from the
 * beginning of the file.
 */
class GzipFileSource : public FileSource {
   public:
    explicit GzipFileSource(const std::string &path);
    ~GzipFileSource() override;

    void open() override;
    void close() override;
    std::string read(std::int64_t size) override;
    std::uint64_t seek(std::int64_t offset, int whence = SEEK_SET) override;
    std::uint64_t tell() const override;
    const char *kind() const override { return "gzip"; }

    static bool is_gzip_file(const std::string &path);

   private:
    void restart();
    void skip(std::uint64_t bytes);
    std::size_t inflate_into(char *out, std::size_t size);

    FILE *file_handle_;
    std::unique_ptr<Inflater> inflater_;
    std::uint64_t position_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_READER_FILE_SOURCE_H
