#include "kirei/consolelogger.hpp"

#include <iostream>
#include <sstream>

kirei::ConsoleLogger& kirei::ConsoleLogger::instance() {
  static kirei::ConsoleLogger instance;
  return instance;
}

void kirei::ConsoleLogger::init(const LogLevel level) { setLogLevel(level); }

void kirei::ConsoleLogger::setLogLevel(kirei::LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void kirei::ConsoleLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout.flush();
}

void kirei::ConsoleLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::string formattedMsg;
  try {
    std::ostringstream formatted;
    formatted << TimeFormatter::format(std::chrono::system_clock::now())
              << " [" << leveltoString(level) << "] " << message;
    formattedMsg = formatted.str();
  } catch (const std::exception& e) {
    formattedMsg = "[LOGGER ERROR: " + std::string(e.what()) + "]";
  }

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    std::cout << colorFor(level) << formattedMsg << KIREI_ANSI_COLOR_RESET
              << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "[LOGGER ERROR: " << e.what() << "] " << formattedMsg
              << std::endl;
  }
}

bool kirei::ConsoleLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

const char* kirei::ConsoleLogger::colorFor(LogLevel level) {
  switch (level) {
    case LogLevel::LOG_DEBUG:
      return "\033[36m";  // Cyan
    case LogLevel::LOG_INFO:
      return "\033[32m";  // Green
    case LogLevel::LOG_WARNING:
      return "\033[33m";  // Yellow
    case LogLevel::LOG_ERROR:
      return "\033[31m";  // Red
    case LogLevel::LOG_CRITICAL:
      return "\033[41m\033[37m";  // White on Red
  }
  return KIREI_ANSI_COLOR_RESET;
}
