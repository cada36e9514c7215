#ifndef BUILDLOG_UTILS_READER_ERROR_H
#define BUILDLOG_UTILS_READER_ERROR_H

#include <stdexcept>
#include <string>

namespace buildlog::utils {

class ReaderError : public std::runtime_error {
   public:
    enum Type {
        NOT_FOUND,
        PERMISSION_DENIED,
        FORMAT_ERROR,
        READ_ERROR,
        VALIDATION_ERROR,
        TIMEOUT,
        TASK_ERROR
    };

    ReaderError(Type type, const std::string &message)
        : std::runtime_error(format_message(type, message)),
          type_(type),
          message_(message) {}

    Type get_type() const { return type_; }
    const std::string &get_message() const { return message_; }

    static const char *type_name(Type type);

   private:
    static std::string format_message(Type type, const std::string &message);

    Type type_;
    std::string message_;
};

}  // namespace buildlog::utils

#endif  // BUILDLOG_UTILS_READER_ERROR_H
