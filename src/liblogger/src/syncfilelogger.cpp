#include "kirei/syncfilelogger.hpp"

#include <iostream>

namespace kirei {

SyncFileLogger& SyncFileLogger::instance() {
    static SyncFileLogger instance;
    return instance;
}

bool SyncFileLogger::writeLocked(const std::string& message) {
    if (!appendLocked(message)) return false;
    if (mainLogFile_.is_open()) mainLogFile_.flush();
    else fallbackLogFile_.flush();
    return true;
}

void SyncFileLogger::writeToFile(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        if (writeLocked(message)) return;

        std::cerr << "[LOGGER ERROR] No log file is open for writing! Attempting to reopen files..." << std::endl;
        reopenFilesLocked();
        if (!writeLocked(message)) {
            std::cerr << "[LOGGER ERROR] Still no log file is open for writing after reopen!" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[LOGGER ERROR] Exception during file write: " << e.what() << std::endl;
    }
}

}  // namespace kirei
