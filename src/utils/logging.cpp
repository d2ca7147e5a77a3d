#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace meetscribe {
namespace utils {

bool Logger::initialized_ = false;
LogLevel Logger::level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::initialize(LogLevel level) {
  setLevel(level);
  if (!initialized_) {
    initialized_ = true;
    info("Logger initialized");
  }
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::getLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

void Logger::info(const std::string &message) {
  write(LogLevel::INFO, "[INFO] ", message);
}

void Logger::warn(const std::string &message) {
  write(LogLevel::WARN, "[WARN] ", message);
}

void Logger::error(const std::string &message) {
  write(LogLevel::ERROR, "[ERROR] ", message);
}

void Logger::debug(const std::string &message) {
  write(LogLevel::DEBUG, "[DEBUG] ", message);
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  return LogLevel::INFO;
}

void Logger::write(LogLevel level, const char *tag, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) {
    return;
  }

  if (level == LogLevel::ERROR) {
    std::cerr << tag << message << std::endl;
  } else {
    std::cout << tag << message << std::endl;
  }
}

} // namespace utils
} // namespace meetscribe
