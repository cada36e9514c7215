#include <buildlog/utils/reader/error.h>

namespace buildlog::utils {

const char *ReaderError::type_name(Type type) {
    switch (type) {
        case NOT_FOUND:
            return "NOT_FOUND";
        case PERMISSION_DENIED:
            return "PERMISSION_DENIED";
        case FORMAT_ERROR:
            return "FORMAT";
        case READ_ERROR:
            return "READ";
        case VALIDATION_ERROR:
            return "VALIDATION";
        case TIMEOUT:
            return "TIMEOUT";
        case TASK_ERROR:
            return "TASK";
    }
    return "UNKNOWN";
}

std::string ReaderError::format_message(Type type, const std::string &message) {
    return std::string("[") + type_name(type) + "] " + message;
}

}  // namespace buildlog::utils
