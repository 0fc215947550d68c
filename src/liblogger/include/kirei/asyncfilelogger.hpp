#pragma once

#include "kirei/basefilelogger.hpp"

#include <condition_variable>
#include <cstdint>
#include <queue>
#include <thread>
#include <vector>

namespace kirei {

/**
 * @class AsyncFileLogger
 * @brief Файловый логгер с фоновой записью пачками.
 *
 * @details
 * Сообщения складываются в очередь и записываются рабочим потоком, когда
 * пачка достигла maxBatchSize или истёк flushInterval. flush() блокирует
 * вызывающего до записи всего, что было поставлено в очередь до вызова.
 */
class AsyncFileLogger : public BaseFileLogger {
public:
    static AsyncFileLogger& instance();

    void setFlushInterval(std::chrono::milliseconds interval);
    void setMaxBatchSize(size_t size);
    void flush() override;

protected:
    void writeToFile(const std::string& formattedMessage) override;
    void flushBatch();

private:
    AsyncFileLogger();
    ~AsyncFileLogger() override;
    void processQueue();

    std::vector<std::string> batchBuffer_;
    std::chrono::steady_clock::time_point lastFlushTime_;
    std::chrono::milliseconds flushInterval_{100};
    size_t maxBatchSize_{100};
    std::queue<std::string> logQueue_;
    std::mutex queueMutex_;
    std::condition_variable queueCV_;
    std::condition_variable flushedCV_;
    std::uint64_t flushRequests_ = 0;
    std::uint64_t flushedUpTo_ = 0;
    std::thread workerThread_;
    bool running_ = true;
};

}  // namespace kirei
