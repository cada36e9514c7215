#ifndef BUILDLOG_UTILS_READER_FILE_SOURCE_FACTORY_H
#define BUILDLOG_UTILS_READER_FILE_SOURCE_FACTORY_H

#include <buildlog/utils/reader/file_source.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace buildlog::utils {

/**
 * Selects a FileSource implementation for a path.
 *
 * Lookup is by lower-cased extension first (".txt" and ".log" map to
 * TextFileSource, ".gz" to GzipFileSource). Unknown extensions fall back
 * to sniffing the gzip magic bytes; anything else is a FORMAT_ERROR.
 */
class FileSourceFactory {
   public:
    using Creator =
        std::function<std::unique_ptr<FileSource>(const std::string &)>;

    FileSourceFactory();

    /**
     * @throws ReaderError NOT_FOUND if path does not exist
     * @throws ReaderError FORMAT_ERROR if no handler accepts the file
     */
    std::unique_ptr<FileSource> create(const std::string &path) const;

    /**
     * Register or replace the creator used for an extension (".ext")
     */
    void register_handler(const std::string &extension, Creator creator);
    bool has_handler(const std::string &extension) const;

   private:
    static std::string normalize_extension(const std::string &extension);

    mutable std::mutex mutex_;
    std::map<std::string, Creator> handlers_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_READER_FILE_SOURCE_FACTORY_H
