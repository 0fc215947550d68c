#include "kirei/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

bool kirei::TimeFormatter::setGlobalFormat(const std::string& fmt) {
  if (fmt.empty()) {
    std::cerr << "Empty time format is not allowed" << std::endl;
    return false;
  }
  std::lock_guard<std::mutex> lock(formatMutex_);
  globalFormat_ = fmt;
  return true;
}

std::string kirei::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
  try {
    auto now_time = std::chrono::system_clock::to_time_t(tp);
    std::tm now_tm;
    localtime_r(&now_time, &now_tm);

    std::string pattern;
    {
      std::lock_guard<std::mutex> lock(formatMutex_);
      pattern = globalFormat_;
    }

    std::ostringstream oss;
    oss << std::put_time(&now_tm, pattern.c_str());
    return oss.str();
  } catch (const std::exception&) {
    return "[INVALID_TIME]";
  }
}

kirei::LogLevel kirei::ILogger::getLogLevel() const {
  return currentLevel_.load(std::memory_order_acquire);
}

void kirei::ILogger::debug(const std::string& message) {
  log(kirei::LogLevel::LOG_DEBUG, message);
}

void kirei::ILogger::info(const std::string& message) {
  log(kirei::LogLevel::LOG_INFO, message);
}

void kirei::ILogger::warning(const std::string& message) {
  log(kirei::LogLevel::LOG_WARNING, message);
}

void kirei::ILogger::error(const std::string& message) {
  log(kirei::LogLevel::LOG_ERROR, message);
}

void kirei::ILogger::critical(const std::string& message) {
  log(kirei::LogLevel::LOG_CRITICAL, message);
}

std::string kirei::leveltoString(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "DEBUG";
    case LogLevel::LOG_INFO:
      return "INFO";
    case LogLevel::LOG_WARNING:
      return "WARNING";
    case LogLevel::LOG_ERROR:
      return "ERROR";
    case LogLevel::LOG_CRITICAL:
      return "CRITICAL";
  }
  return "";
}

kirei::LogLevel kirei::stringToLogLevel(const std::string& level) {
  std::string lower = level;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lower == "debug") return LogLevel::LOG_DEBUG;
  if (lower == "info") return LogLevel::LOG_INFO;
  if (lower == "warning" || lower == "warn") return LogLevel::LOG_WARNING;
  if (lower == "error") return LogLevel::LOG_ERROR;
  if (lower == "critical") return LogLevel::LOG_CRITICAL;
  return LogLevel::LOG_INFO;
}
