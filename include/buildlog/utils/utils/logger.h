#ifndef BUILDLOG_UTILS_UTILS_LOGGER_H
#define BUILDLOG_UTILS_UTILS_LOGGER_H

#ifdef __cplusplus
extern "C" {
#endif
/**
 * Set the global log level programmatically
 * @param level_str String representation of log level (case insensitive)
 *                  Valid values: "trace", "debug", "info", "warn"/"warning",
 *                  "err"/"error", "critical", "off"
 * @return 0 on success, -1 if level_str is empty or NULL
 */
int buildlog_utils_set_log_level(const char *level_str);

/**
 * Set the global log level using integer level
 * @param level 0=trace, 1=debug, 2=info, 3=warn, 4=error, 5=critical, 6=off
 * @return 0 on success, -1 if level is out of range
 */
int buildlog_utils_set_log_level_int(int level);

/**
 * Get the current global log level as a string
 * @return Pointer to a static string, valid until the next call
 */
const char *buildlog_utils_get_log_level_string(void);

int buildlog_utils_get_log_level_int(void);

#ifdef __cplusplus
}

#include <string>

namespace buildlog::utils::logger {
int set_log_level(const std::string &level_str);
int set_log_level_int(int level);
std::string get_log_level_string();
int get_log_level_int();

/**
 * Route all library logging to stderr with the given level
 */
void init_stderr_logger(const std::string &level_str);
}  // namespace buildlog::utils::logger
#endif

#endif  // BUILDLOG_UTILS_UTILS_LOGGER_H
