#include <buildlog/utils/common/logging.h>
#include <buildlog/utils/reader/file_source_factory.h>
#include <buildlog/utils/utils/filesystem.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace buildlog::utils {

FileSourceFactory::FileSourceFactory() {
    auto text_creator = [](const std::string &path) {
        return std::make_unique<TextFileSource>(path);
    };
    handlers_[".txt"] = text_creator;
    handlers_[".log"] = text_creator;
    handlers_[".gz"] = [](const std::string &path) {
        return std::make_unique<GzipFileSource>(path);
    };
}

std::string FileSourceFactory::normalize_extension(
    const std::string &extension) {
    std::string ext = extension;
    if (!ext.empty() && ext[0] != '.') {
        ext.insert(ext.begin(), '.');
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

void FileSourceFactory::register_handler(const std::string &extension,
                                         Creator creator) {
    if (extension.empty() || !creator) {
        throw ReaderError(ReaderError::VALIDATION_ERROR,
                          "Handler registration requires an extension and a "
                          "creator");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[normalize_extension(extension)] = std::move(creator);
}

bool FileSourceFactory::has_handler(const std::string &extension) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(normalize_extension(extension)) > 0;
}

std::unique_ptr<FileSource> FileSourceFactory::create(
    const std::string &path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw ReaderError(ReaderError::NOT_FOUND, "File not found: " + path);
    }

    Creator creator;
    std::string ext = normalize_extension(fs::path(path).extension().string());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(ext);
        if (it != handlers_.end()) {
            creator = it->second;
        }
    }

    if (creator) {
        BUILDLOG_UTILS_LOG_DEBUG("Using handler for extension '%s' on %s",
                                 ext.c_str(), path.c_str());
        return creator(path);
    }

    if (GzipFileSource::is_gzip_file(path)) {
        BUILDLOG_UTILS_LOG_DEBUG("Detected gzip content in %s", path.c_str());
        return std::make_unique<GzipFileSource>(path);
    }

    throw ReaderError(ReaderError::FORMAT_ERROR,
                      "Unsupported file type: " + path);
}

}  // namespace buildlog::utils
