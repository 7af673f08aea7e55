/**
 * @file logging.cpp
 * @brief Logger implementation
 */

#include "hls_pack/logging.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/color.h>

namespace hls_pack {

const char *log_level_name(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
  case LogLevel::Phase:
  case LogLevel::Success:
    return "INFO";
  case LogLevel::Warn:
    return "WARNING";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string current_timestamp() {
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::time(nullptr)));
}

Logger::Logger(const std::string &log_file, bool console) : console_(console) {
  if (!log_file.empty()) {
    file_ = std::fopen(log_file.c_str(), "a");
    file_failed_ = (file_ == nullptr);
  }
}

Logger::~Logger() {
  if (file_)
    std::fclose(file_);
}

void Logger::write(LogLevel level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string stamp = current_timestamp();

  if (console_ && level != LogLevel::Debug) {
    switch (level) {
    case LogLevel::Warn:
      fmt::print(fg(fmt::color::yellow), "{} - {}\n", stamp, message);
      break;
    case LogLevel::Error:
      fmt::print(fg(fmt::color::red), "{} - ERROR: {}\n", stamp, message);
      break;
    case LogLevel::Phase:
      fmt::print(fg(fmt::color::cyan), "{} - {}\n", stamp, message);
      break;
    case LogLevel::Success:
      fmt::print(fg(fmt::color::green), "{} - {}\n", stamp, message);
      break;
    default:
      fmt::print("{} - {}\n", stamp, message);
      break;
    }
    std::fflush(stdout);
  }

  if (file_) {
    fmt::print(file_, "{} - {} - {}\n", stamp, log_level_name(level), message);
    std::fflush(file_);
  }
}

} // namespace hls_pack
