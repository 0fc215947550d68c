#include "kirei/asyncfilelogger.hpp"

#include <iostream>

namespace kirei {

namespace {
constexpr std::chrono::seconds kFlushWaitLimit{2};
}

AsyncFileLogger& AsyncFileLogger::instance() {
    static AsyncFileLogger instance;
    return instance;
}

AsyncFileLogger::AsyncFileLogger() {
    workerThread_ = std::thread(&AsyncFileLogger::processQueue, this);
}

AsyncFileLogger::~AsyncFileLogger() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        running_ = false;
    }
    queueCV_.notify_all();
    if (workerThread_.joinable()) {
        workerThread_.join();
    }
    BaseFileLogger::flush();
}

void AsyncFileLogger::writeToFile(const std::string& formattedMessage) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        logQueue_.push(formattedMessage);
    }
    queueCV_.notify_one();
}

void AsyncFileLogger::flush() {
    std::uint64_t ticket = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_) return;
        ticket = ++flushRequests_;
    }
    queueCV_.notify_one();
    {
        std::unique_lock<std::mutex> lock(queueMutex_);
        flushedCV_.wait_for(lock, kFlushWaitLimit,
                            [this, ticket] { return flushedUpTo_ >= ticket; });
    }
    BaseFileLogger::flush();
}

void AsyncFileLogger::processQueue() {
    auto now = []{ return std::chrono::steady_clock::now(); };
    lastFlushTime_ = now();

    while (true) {
        bool force = false;
        bool stop = false;
        std::uint64_t ticket = 0;
        size_t maxBatch = 0;
        std::chrono::milliseconds interval{0};
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCV_.wait_for(lock, flushInterval_, [this] {
                return !logQueue_.empty() || !running_ ||
                       flushRequests_ != flushedUpTo_;
            });

            ticket = flushRequests_;
            force = ticket != flushedUpTo_ || !running_;
            maxBatch = maxBatchSize_;
            interval = flushInterval_;
            while (!logQueue_.empty() && (force || batchBuffer_.size() < maxBatch)) {
                batchBuffer_.push_back(std::move(logQueue_.front()));
                logQueue_.pop();
            }
            stop = !running_ && logQueue_.empty();
        }

        // По размеру пачки, по таймеру или по явному запросу
        bool needsFlush = force || batchBuffer_.size() >= maxBatch ||
                          (now() - lastFlushTime_) >= interval;
        if (!batchBuffer_.empty() && needsFlush) {
            flushBatch();
        }

        if (force) {
            {
                std::lock_guard<std::mutex> lock(queueMutex_);
                flushedUpTo_ = ticket;
            }
            flushedCV_.notify_all();
        }
        if (stop) break;
    }
}

void AsyncFileLogger::flushBatch() {
    if (batchBuffer_.empty()) return;

    std::lock_guard<std::mutex> fileLock(mutex_);
    try {
        for (const auto& msg : batchBuffer_) {
            if (appendLocked(msg)) continue;

            std::cerr << "[LOGGER ERROR] No log file is open for writing! Attempting to reopen files..." << std::endl;
            reopenFilesLocked();
            if (!appendLocked(msg)) {
                std::cerr << "[LOGGER ERROR] Still no log file is open for writing after reopen!" << std::endl;
            }
        }
        if (mainLogFile_.is_open()) mainLogFile_.flush();
        else if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
    } catch (const std::exception& e) {
        std::cerr << "[LOGGER ERROR] Exception during async file write: " << e.what() << std::endl;
    }
    batchBuffer_.clear();
    lastFlushTime_ = std::chrono::steady_clock::now();
}

void AsyncFileLogger::setFlushInterval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    flushInterval_ = interval;
}

void AsyncFileLogger::setMaxBatchSize(size_t size) {
    std::lock_guard<std::mutex> lock(queueMutex_);
    maxBatchSize_ = size;
}

}  // namespace kirei
