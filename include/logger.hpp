#ifndef LOGGER_HPP
#define LOGGER_HPP
#include <string>
#include <map>

enum class LogLevel { DEBUG = 0, INFO, WARNING, ERR };

/** Structured key/value fields attached to a log line. */
using LogFields = std::map<std::string, std::string>;

/**
 * @brief Initialize the file logger.
 *
 * Opens the log file at @p path (creating missing parent directories) and
 * starts the background writer thread.
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
 * @brief Parse a level name such as `debug`, `INFO` or `error`.
 *
 * @param name  Case-insensitive level name.
 * @param level Receives the parsed level.
 * @return `true` when @p name names a known level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

/**
 * @brief Enable or disable JSON formatted logging.
 *
 * @param enable Set to `true` to emit one JSON object per line instead of
 *               plain text.
 */
void set_json_logging(bool enable);

/**
 * @brief Compress rotated log files with gzip.
 */
void set_log_compression(bool enable);

void set_log_rotation(size_t max_files);

/**
 * @brief Check whether the logger has been initialized.
 *
 * @return `true` if the log file is open; `false` otherwise.
 */
bool logger_initialized();

/**
 * @brief Block until every queued message has been written.
 */
void flush_logger();

void log_event(LogLevel level, const std::string& message);
void log_event(LogLevel level, const std::string& message, const std::string& data);

/**
 * @brief Log a message with structured key/value fields.
 *
 * @param level   Severity level for the event.
 * @param message Human-readable text describing the event.
 * @param fields  Map of field names to values, e.g. `{{"spec", id}}`.
 */
void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields);

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
 * @brief Mirror log entries to syslog using the specified facility.
 *
 * @param facility Syslog facility identifier (`0` selects `LOG_USER`).
 */
void init_syslog(int facility = 0);

/**
 * @brief Drain the queue, close the log file and stop the writer thread.
 */
void shutdown_logger();

#endif // LOGGER_HPP
