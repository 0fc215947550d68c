#pragma once

#include "kirei/ilogger.hpp"

#include <initializer_list>
#include <memory>
#include <mutex>
#include <vector>

namespace kirei {

/**
 * @class CompositeLogger
 * @brief Рассылает сообщения всем зарегистрированным логгерам.
 *
 * @details
 * Глобальная точка логирования для всех компонентов движка. Без
 * зарегистрированных приёмников сообщения молча отбрасываются, поэтому
 * библиотечный код и тесты могут логировать без предварительной настройки.
 */
class CompositeLogger : public ILogger {
public:
    static CompositeLogger& instance();

    CompositeLogger() = default;
    CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
        : loggers_(loggers) {}
    ~CompositeLogger() override = default;

    CompositeLogger(const CompositeLogger&) = delete;
    CompositeLogger& operator=(const CompositeLogger&) = delete;

    void addLogger(const std::shared_ptr<ILogger>& logger);
    void clearLoggers();
    size_t size() const;

    void init(const LogLevel level) override;
    void setLogLevel(LogLevel level) override;
    void flush() override;

    void debug(const std::string& message) override;
    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;
    void critical(const std::string& message) override;

protected:
    bool shouldSkipLog(LogLevel level) const override;
    void log(LogLevel level, const std::string& message) override;

private:
    std::vector<std::shared_ptr<ILogger>> snapshot() const;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace kirei
