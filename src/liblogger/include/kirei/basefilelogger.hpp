#pragma once
#include "kirei/ilogger.hpp"
#include "kirei/irotatablelogger.hpp"
#include <cstdint>
#include <fstream>
#include <filesystem>
#include <mutex>

namespace kirei {

/**
 * @class BaseFileLogger
 * @brief Общая часть файловых логгеров: основной и резервный файл, ротация.
 *
 * @details
 * Если основной файл открыть не удалось, запись идёт в резервный.
 * Конкретный способ доставки (сразу или через очередь) определяет
 * наследник в writeToFile(); сама запись в файл выполняется appendLocked(),
 * которая перед записью при необходимости ротирует основной журнал.
 * Резервный файл не ротируется.
 */
class BaseFileLogger : public ILogger, public IRotatableLogger {
public:

    void init(const LogLevel level) override;
    void setLogLevel(LogLevel level) override;
    void setRotationConfig(const RotationConfig& config) override;
    RotationConfig getRotationConfig() const override;
    void flush() override;
    void setMainLogPath(const std::string& path);
    void setFallbackLogPath(const std::string& path);
    std::string getMainLogPath() const;
    std::string getFallbackLogPath() const;
    void log(LogLevel level, const std::string& message) override;

protected:
    BaseFileLogger() = default;
    ~BaseFileLogger() override = default;
    virtual void writeToFile(const std::string& formattedMessage) = 0;

    void reopenFiles();
    // Вызывающий уже держит mutex_
    void reopenFilesLocked();
    /**
     * @brief Запись одного сообщения в основной (или резервный) файл
     * @return false, если ни один файл не открыт
     * @note Вызывающий держит mutex_
     */
    bool appendLocked(const std::string& message);
    bool shouldSkipLog(LogLevel level) const override;

    mutable std::mutex mutex_;
    std::ofstream mainLogFile_;
    std::ofstream fallbackLogFile_;
    std::string mainLogPath_ = "kirei.log";
    std::string fallbackLogPath_ = "kirei_fallback.log";

private:
    bool rotationDueLocked(std::size_t incoming) const;
    void rotateLocked();
    void shiftBackupsLocked();

    RotationConfig rotationConfig_;
    std::uintmax_t mainBytes_ = 0;
    std::chrono::system_clock::time_point mainOpenedAt_ = std::chrono::system_clock::now();
    bool warnedAboutFallback_ = false;
};

}  // namespace kirei
