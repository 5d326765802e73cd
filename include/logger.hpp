#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <cstddef>
#include <map>
#include <string>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path for append and starts the background writer
 * thread. Calling it again switches to the new file.
 *
 * @param path      Filesystem path where the log file will be written.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING, ERROR), case-insensitive.
 *
 * @param name  Level name.
 * @param level Receives the parsed level on success.
 * @return `false` if @a name is not a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Emit log lines as JSON objects instead of plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Check whether the logger has been initialized.
 *
 * Messages logged before initialization are discarded.
 */
bool logger_initialized();

/**
 * @brief Log helpers per severity.
 *
 * The @a data overload records a single `data` field; the map overload
 * records structured key/value fields.
 */
void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::string& data);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::string& data);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::string& data);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);

void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::string& data);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log lines to syslog using the specified facility.
 *
 * No-op on platforms without syslog.
 */
void init_syslog(int facility = 0);

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

/**
 * @brief Shut down the logging subsystem and release resources.
 */
void shutdown_logger();

#endif // LOGGER_HPP
