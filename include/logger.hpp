#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/**
 * @brief Start the asynchronous logger.
 *
 * Messages are queued by the `log_*` functions and written by a background
 * thread. When @p path is empty, entries go to stderr; otherwise the file is
 * opened for append and rotated once it grows beyond @p max_size.
 *
 * @param path      Log file path, or empty for stderr.
 * @param level     Minimum @ref LogLevel severity to record.
 * @param max_size  Maximum size in bytes before rotating the file. A value of
 *                  `0` disables size-based rotation.
 * @param max_files Number of rotated log files to keep.
 */
void init_logger(const std::string& path, LogLevel level = LogLevel::INFO, size_t max_size = 0,
                 size_t max_files = 1);

/**
 * @brief Emit entries as JSON objects instead of plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Gzip rotated log files.
 */
void set_log_compression(bool enable);

/**
 * @brief Check whether the logger thread is running.
 */
bool logger_initialized();

/**
 * @brief Block until every queued entry has been written.
 */
void flush_logger();

/**
 * @brief Parse a level name (DEBUG, INFO, WARNING/WARN, ERROR/ERR).
 *
 * Matching is case-insensitive.
 *
 * @return `true` and sets @p out on success.
 */
bool parse_log_level(const std::string& name, LogLevel& out);

/** @brief Upper-case label used in log lines. */
const char* log_level_name(LogLevel level);

/**
 * @brief Log a message with the specified severity.
 */
void log_event(LogLevel level, const std::string& message);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values providing structured context.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

void log_debug(const std::string& msg);
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_info(const std::string& msg);
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_warning(const std::string& msg);
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields);
void log_error(const std::string& msg);
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields);

/**
 * @brief Mirror log entries to syslog using the specified facility.
 */
void init_syslog(int facility = 0);

/**
 * @brief Drain the queue, stop the logger thread and close all sinks.
 */
void shutdown_logger();

#endif // LOGGER_HPP
