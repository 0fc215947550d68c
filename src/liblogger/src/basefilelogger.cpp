#include "kirei/basefilelogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>

namespace kirei {

namespace fs = std::filesystem;

namespace {

// Суффикс архива для ротации по времени
std::string archiveStamp(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm local{};
  localtime_r(&t, &local);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &local);
  return buffer;
}

std::uintmax_t sizeOnDisk(const std::string& path) {
  std::error_code ec;
  const auto size = fs::file_size(path, ec);
  return ec ? 0 : size;
}

}  // namespace

void BaseFileLogger::init(const LogLevel level) {
  setLogLevel(level);
  reopenFiles();
}

void BaseFileLogger::setLogLevel(LogLevel level) {
  currentLevel_.store(level, std::memory_order_release);
}

void BaseFileLogger::setRotationConfig(const RotationConfig& config) {
  std::lock_guard<std::mutex> lock(mutex_);
  rotationConfig_ = config;
  mainOpenedAt_ = std::chrono::system_clock::now();
}

RotationConfig BaseFileLogger::getRotationConfig() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotationConfig_;
}

void BaseFileLogger::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogFile_.is_open()) mainLogFile_.flush();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void BaseFileLogger::log(LogLevel level, const std::string& message) {
  if (shouldSkipLog(level)) return;

  std::ostringstream formatted;
  formatted << TimeFormatter::format(std::chrono::system_clock::now())
            << " [" << leveltoString(level) << "] " << message << "\n";
  writeToFile(formatted.str());
}

bool BaseFileLogger::shouldSkipLog(LogLevel level) const {
  return static_cast<int>(level) <
         static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

void BaseFileLogger::reopenFiles() {
  std::lock_guard<std::mutex> lock(mutex_);
  reopenFilesLocked();
}

void BaseFileLogger::reopenFilesLocked() {
  if (mainLogFile_.is_open()) mainLogFile_.close();
  if (fallbackLogFile_.is_open()) fallbackLogFile_.close();

  mainLogFile_.open(mainLogPath_, std::ios::app);
  if (mainLogFile_.is_open()) {
    mainBytes_ = sizeOnDisk(mainLogPath_);
    mainOpenedAt_ = std::chrono::system_clock::now();
    return;
  }

  std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
            << std::endl;
  fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
  if (!fallbackLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
              << fallbackLogPath_ << std::endl;
  }
}

bool BaseFileLogger::appendLocked(const std::string& message) {
  if (mainLogFile_.is_open() && rotationDueLocked(message.size())) {
    rotateLocked();
  }

  if (mainLogFile_.is_open()) {
    mainLogFile_ << message;
    mainBytes_ += message.size();
    warnedAboutFallback_ = false;
    return true;
  }
  if (fallbackLogFile_.is_open()) {
    if (!warnedAboutFallback_) {
      std::cerr << "[LOGGER WARNING] Main log file unavailable, switching to "
                   "fallback log file: "
                << fallbackLogPath_ << std::endl;
      warnedAboutFallback_ = true;
    }
    fallbackLogFile_ << message;
    return true;
  }
  return false;
}

bool BaseFileLogger::rotationDueLocked(std::size_t incoming) const {
  // Пустой журнал архивировать незачем
  if (!rotationConfig_.enabled || mainBytes_ == 0) return false;

  switch (rotationConfig_.type) {
    case RotationType::SIZE:
      return rotationConfig_.maxFileSizeBytes > 0 &&
             mainBytes_ + incoming > rotationConfig_.maxFileSizeBytes;
    case RotationType::TIME:
      return rotationConfig_.rotationInterval.count() > 0 &&
             std::chrono::system_clock::now() - mainOpenedAt_ >=
                 rotationConfig_.rotationInterval;
    case RotationType::NONE:
      break;
  }
  return false;
}

void BaseFileLogger::shiftBackupsLocked() {
  const std::size_t keep = std::max<std::size_t>(rotationConfig_.maxBackups, 1);
  std::error_code ec;
  fs::remove(mainLogPath_ + "." + std::to_string(keep), ec);
  for (std::size_t i = keep - 1; i >= 1; --i) {
    const std::string from = mainLogPath_ + "." + std::to_string(i);
    if (!fs::exists(from, ec)) continue;
    fs::rename(from, mainLogPath_ + "." + std::to_string(i + 1), ec);
    if (ec) {
      std::cerr << "[LOGGER ERROR] Cannot shift log backup " << from << ": "
                << ec.message() << std::endl;
    }
  }
}

void BaseFileLogger::rotateLocked() {
  const auto now = std::chrono::system_clock::now();
  mainLogFile_.flush();
  mainLogFile_.close();

  std::string archive;
  if (rotationConfig_.type == RotationType::SIZE) {
    shiftBackupsLocked();
    archive = mainLogPath_ + ".1";
  } else {
    const std::string base = mainLogPath_ + "." + archiveStamp(now);
    archive = base;
    std::error_code probe;
    for (int n = 1; fs::exists(archive, probe); ++n) {
      archive = base + "_" + std::to_string(n);
    }
  }

  std::error_code ec;
  fs::rename(mainLogPath_, archive, ec);
  if (ec) {
    std::cerr << "[LOGGER ERROR] Cannot archive log file " << mainLogPath_
              << " to " << archive << ": " << ec.message() << std::endl;
  }

  mainLogFile_.open(mainLogPath_, std::ios::app);
  mainBytes_ = sizeOnDisk(mainLogPath_);
  mainOpenedAt_ = now;
  if (!mainLogFile_.is_open()) {
    std::cerr << "[LOGGER ERROR] Cannot open new log file after rotation: "
              << mainLogPath_ << std::endl;
    if (!fallbackLogFile_.is_open()) {
      fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
    }
  }
}

void BaseFileLogger::setMainLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (mainLogPath_ == path) return;
  mainLogPath_ = path;
  reopenFilesLocked();
}

void BaseFileLogger::setFallbackLogPath(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fallbackLogPath_ == path) return;
  fallbackLogPath_ = path;
  reopenFilesLocked();
}

std::string BaseFileLogger::getMainLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return mainLogPath_;
}

std::string BaseFileLogger::getFallbackLogPath() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fallbackLogPath_;
}

std::optional<RotationType> rotationTypeFromString(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "size") return RotationType::SIZE;
  if (lower == "time") return RotationType::TIME;
  if (lower == "none") return RotationType::NONE;
  return std::nullopt;
}

}  // namespace kirei
