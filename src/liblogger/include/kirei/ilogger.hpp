/**
 * @file ilogger.hpp
 * @brief Базовый интерфейс логгеров Kirei и вспомогательные компоненты.
 *
 * @details
 * Содержит перечисление уровней логирования, форматтер временных меток и
 * абстрактный класс ILogger, от которого наследуются все приёмники
 * (консоль, синхронный и асинхронный файловый логгер, композитный логгер).
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace kirei {

/**
 * @enum LogLevel
 * @brief Уровни важности сообщений, упорядоченные по возрастанию.
 */
enum class LogLevel {
  LOG_DEBUG,
  LOG_INFO,
  LOG_WARNING,
  LOG_ERROR,
  LOG_CRITICAL
};

/**
 * @class TimeFormatter
 * @brief Форматирование временных меток по глобальному шаблону strftime.
 */
class TimeFormatter {
 public:
  /**
   * @brief Устанавливает глобальный шаблон форматирования.
   * @param fmt Шаблон в синтаксисе std::put_time (например, "%H:%M:%S")
   * @return true, если шаблон применён
   */
  static bool setGlobalFormat(const std::string& fmt);

  static std::string format(const std::chrono::system_clock::time_point& tp);

 private:
  inline static std::string globalFormat_ = "%Y-%m-%d %T";
  inline static std::mutex formatMutex_;
};

/**
 * @class ILogger
 * @brief Абстрактный приёмник сообщений журнала.
 *
 * @details
 * Методы debug()..critical() делегируют в защищённый log(); наследник решает,
 * куда и как писать сообщение. Фильтрация по уровню выполняется в
 * shouldSkipLog().
 */
class ILogger {
 public:
  virtual void init(const LogLevel level) = 0;

  virtual void setLogLevel(LogLevel level) = 0;
  virtual LogLevel getLogLevel() const;

  virtual void debug(const std::string& message);
  virtual void info(const std::string& message);
  virtual void warning(const std::string& message);
  virtual void error(const std::string& message);
  virtual void critical(const std::string& message);

  virtual void flush() = 0;

 protected:
  std::atomic<LogLevel> currentLevel_ = LogLevel::LOG_INFO;
  virtual ~ILogger() = default;
  virtual void log(LogLevel, const std::string&) = 0;
  virtual bool shouldSkipLog(LogLevel level) const = 0;
};

std::string leveltoString(LogLevel level);

/**
 * @brief Преобразует строковое имя уровня ("debug", "info", ...) в LogLevel.
 * @note Неизвестные значения дают LogLevel::LOG_INFO.
 */
LogLevel stringToLogLevel(const std::string& level);

}  // namespace kirei
