#ifndef BUILDLOG_UTILS_COMMON_LOGGING_H
#define BUILDLOG_UTILS_COMMON_LOGGING_H

#include <spdlog/spdlog.h>

#include <cstdarg>
#include <cstdio>
#include <string>
#include <vector>

namespace buildlog::utils {

#if defined(__GNUC__)
__attribute__((format(printf, 1, 2)))
#endif
inline std::string buildlog_utils_macro_format(const char *format, ...) {
    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);
    int needed = std::vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);
    if (needed <= 0) {
        va_end(args);
        return std::string();
    }
    std::vector<char> buffer(static_cast<std::size_t>(needed) + 1);
    std::vsnprintf(buffer.data(), buffer.size(), format, args);
    va_end(args);
    return std::string(buffer.data(), static_cast<std::size_t>(needed));
}

}  // namespace buildlog::utils

#define BUILDLOG_UTILS_LOGGER_NAME "BUILDLOG_UTILS"

#define BUILDLOG_UTILS_INTERNAL_LOG(file, line, function, logger_level, ...) \
    do {                                                                     \
        if (spdlog::should_log(logger_level)) {                              \
            spdlog::log(logger_level, "{} {} [{}:{}]", function,             \
                        buildlog::utils::buildlog_utils_macro_format(        \
                            __VA_ARGS__),                                    \
                        file, line);                                         \
        }                                                                    \
    } while (0)

// Compile-time level gate; the runtime level is controlled through spdlog
// (see buildlog/utils/utils/logger.h).
#if defined(BUILDLOG_UTILS_LOGGER_LEVEL_TRACE) && \
    (BUILDLOG_UTILS_LOGGER_LEVEL_TRACE == 1)
#define BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL 0
#elif defined(BUILDLOG_UTILS_LOGGER_LEVEL_DEBUG) && \
    (BUILDLOG_UTILS_LOGGER_LEVEL_DEBUG == 1)
#define BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL 1
#elif defined(BUILDLOG_UTILS_LOGGER_LEVEL_INFO) && \
    (BUILDLOG_UTILS_LOGGER_LEVEL_INFO == 1)
#define BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL 2
#elif defined(BUILDLOG_UTILS_LOGGER_LEVEL_WARN) && \
    (BUILDLOG_UTILS_LOGGER_LEVEL_WARN == 1)
#define BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL 3
#else
#define BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL 4
#endif

#define BUILDLOG_UTILS_LOGGER_INIT()                  \
    spdlog::set_level(static_cast<spdlog::level::level_enum>( \
        BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL))

#define BUILDLOG_UTILS_LOGGER_LEVEL(level) spdlog::set_level(level)

#if BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL <= 0
#define BUILDLOG_UTILS_LOG_TRACE(...)                                    \
    BUILDLOG_UTILS_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,        \
                                spdlog::level::trace, __VA_ARGS__)
#else
#define BUILDLOG_UTILS_LOG_TRACE(...)
#endif

#if BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL <= 1
#define BUILDLOG_UTILS_LOG_DEBUG(...)                                    \
    BUILDLOG_UTILS_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,        \
                                spdlog::level::debug, __VA_ARGS__)
#else
#define BUILDLOG_UTILS_LOG_DEBUG(...)
#endif

#if BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL <= 2
#define BUILDLOG_UTILS_LOG_INFO(...)                                     \
    BUILDLOG_UTILS_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,        \
                                spdlog::level::info, __VA_ARGS__)
#else
#define BUILDLOG_UTILS_LOG_INFO(...)
#endif

#if BUILDLOG_UTILS_LOGGER_COMPILED_LEVEL <= 3
#define BUILDLOG_UTILS_LOG_WARN(...)                                     \
    BUILDLOG_UTILS_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,        \
                                spdlog::level::warn, __VA_ARGS__)
#else
#define BUILDLOG_UTILS_LOG_WARN(...)
#endif

// Errors are always compiled in
#define BUILDLOG_UTILS_LOG_ERROR(...)                                    \
    BUILDLOG_UTILS_INTERNAL_LOG(__FILE__, __LINE__, __FUNCTION__,        \
                                spdlog::level::err, __VA_ARGS__)

#define BUILDLOG_UTILS_LOG_PRINT(...)                                    \
    std::fputs(buildlog::utils::buildlog_utils_macro_format(__VA_ARGS__) \
                   .c_str(),                                             \
               stdout)

#endif  // BUILDLOG_UTILS_COMMON_LOGGING_H
