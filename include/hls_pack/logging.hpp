/**
 * @file logging.hpp
 * @brief Timestamped console and file logging
 *
 * @details Provides the Logger class:
 *          - Colored, timestamped console output via fmt::print
 *
 *          - Append-only persistent log file
 *
 *          - Thread-safe writes so workers can share one instance
 *
 * @note There is no global logger. main() creates one Logger and passes it by
 *       reference to every component.
 *
 */

#ifndef HLS_PACK_LOGGING_HPP
#define HLS_PACK_LOGGING_HPP

#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

#include <fmt/core.h>

namespace hls_pack {

enum class LogLevel { Debug, Info, Warn, Error, Phase, Success };

/// Level name as written to the log file
const char *log_level_name(LogLevel level);

/**
 * @class Logger
 * @brief Writes each message to the console and appends it to a log file.
 *
 * @attention OUTPUT:
 *
 *   - Console: "<timestamp> - <message>", colored by level (errors carry an
 *     "ERROR: " prefix). Debug messages are not printed.
 *
 *   - File: "<timestamp> - <LEVEL> - <message>" for every level.
 */
class Logger {
public:
  /**
   * @brief Construct a logger.
   * @param log_file Path of the persistent log (empty = no file)
   * @param console Whether messages are echoed to stdout
   */
  explicit Logger(const std::string &log_file = "", bool console = true);
  ~Logger();

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  /// True if a log file was requested but could not be opened
  bool file_failed() const { return file_failed_; }

  template <typename... Args>
  void debug(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Debug,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Info, fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Warn, fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Error,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void phase(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Phase,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void success(fmt::format_string<Args...> format_str, Args &&...args) {
    write(LogLevel::Success,
          fmt::format(format_str, std::forward<Args>(args)...));
  }

  /**
   * @brief Write one already formatted message.
   * @note Thread-safe.
   */
  void write(LogLevel level, const std::string &message);

private:
  std::mutex mutex_;
  std::FILE *file_ = nullptr;
  bool console_;
  bool file_failed_ = false;
};

/// Current local time as "YYYY-MM-DD HH:MM:SS"
std::string current_timestamp();

} // namespace hls_pack

#endif // HLS_PACK_LOGGING_HPP
