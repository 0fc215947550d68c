#pragma once

#include "kirei/ilogger.hpp"

#define KIREI_ANSI_COLOR_RESET "\033[0m"

namespace kirei {

/**
 * @class ConsoleLogger
 * @brief Вывод сообщений в stdout с ANSI-раскраской по уровню.
 */
class ConsoleLogger : public ILogger {
 public:
  static ConsoleLogger& instance();

  void init(const LogLevel level) override;
  void setLogLevel(LogLevel level) override;
  void flush() override;

 protected:
  ConsoleLogger() = default;
  ~ConsoleLogger() override = default;
  void log(LogLevel level, const std::string& message) override;
  bool shouldSkipLog(LogLevel level) const override;

 private:
  static const char* colorFor(LogLevel level);
  mutable std::mutex mutex_;
};

}  // namespace kirei
