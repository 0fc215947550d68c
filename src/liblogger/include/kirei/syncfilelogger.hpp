#pragma once
#include "kirei/basefilelogger.hpp"

namespace kirei {

class SyncFileLogger : public BaseFileLogger {
public:
    static SyncFileLogger& instance();

protected:
    void writeToFile(const std::string& message) override;

private:
    SyncFileLogger() = default;
    bool writeLocked(const std::string& message);
};

}  // namespace kirei
