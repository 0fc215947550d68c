#include "../include/directorywatcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>

#include "../include/enginemetrics.hpp"
#include "../include/pathutils.hpp"
#include "kirei/MetricsCollector.hpp"
#include "kirei/compositelogger.hpp"

namespace fs = std::filesystem;

namespace kirei {

namespace {

constexpr int kPollTimeoutMs = 250;
constexpr uint32_t kFolderEvents = IN_CREATE | IN_MOVED_TO | IN_DELETE_SELF |
                                   IN_MOVE_SELF | IN_ONLYDIR;

class InotifyDescriptor {
 public:
  InotifyDescriptor() : fd_(inotify_init1(IN_NONBLOCK | IN_CLOEXEC)) {
    if (fd_ < 0) {
      throw std::runtime_error(
          std::string("DirectoryWatcher: inotify_init1 failed: ") +
          std::strerror(errno));
    }
  }
  ~InotifyDescriptor() { close(fd_); }

  InotifyDescriptor(const InotifyDescriptor &) = delete;
  InotifyDescriptor &operator=(const InotifyDescriptor &) = delete;

  int get() const { return fd_; }

 private:
  int fd_;
};

}  // namespace

DirectoryWatcher::DirectoryWatcher(std::chrono::milliseconds settleDelay)
    : settleDelay_(settleDelay) {}

DirectoryWatcher::~DirectoryWatcher() { stop(); }

void DirectoryWatcher::stop() noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = true;
  }
  stopCv_.notify_all();
}

bool DirectoryWatcher::stopRequested() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopRequested_;
}

bool DirectoryWatcher::settle(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !stopCv_.wait_until(lock, deadline, [this] { return stopRequested_; });
}

std::optional<std::string> DirectoryWatcher::dispatch(const fs::path &file,
                                                      const RuleList &rules) {
  auto &logger = CompositeLogger::instance();
  if (!extensionOf(file)) {
    logger.debug("DirectoryWatcher: no extension, skipping " + file.string());
    return std::nullopt;
  }

  for (const auto &rule : rules) {
    try {
      if (rule->apply(file)) return rule->name();
    } catch (const std::exception &e) {
      MetricsCollector::instance().incrementCounter(metrics::kStrategyFailures);
      logger.error("DirectoryWatcher: rule " + rule->name() + " failed on " +
                   file.string() + ": " + e.what());
      return std::nullopt;
    }
  }

  logger.debug("DirectoryWatcher: no rule matched " + file.string());
  return std::nullopt;
}

DirectoryWatcher::EventBatch DirectoryWatcher::decodeEvents(
    const char *data, std::size_t length, WatchTable &watches) {
  auto &logger = CompositeLogger::instance();
  auto &collector = MetricsCollector::instance();
  EventBatch batch;

  for (std::size_t offset = 0;
       offset + sizeof(struct inotify_event) <= length;) {
    struct inotify_event header;
    std::memcpy(&header, data + offset, sizeof(header));
    const char *name = data + offset + sizeof(header);
    offset += sizeof(header) + header.len;
    if (offset > length) break;

    if (header.mask & IN_Q_OVERFLOW) {
      ++batch.overflows;
      collector.incrementCounter(metrics::kWatchOverflows);
      logger.warning("DirectoryWatcher: event queue overflow, events lost");
      continue;
    }

    auto folder = watches.find(header.wd);
    if (folder == watches.end()) continue;

    if (header.mask & IN_IGNORED) {
      logger.warning("DirectoryWatcher: watch on " + folder->second.string() +
                     " is no longer valid");
      watches.erase(folder);
      continue;
    }
    if (header.mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
      logger.warning("DirectoryWatcher: " + folder->second.string() +
                     " was removed or moved, dropping watch");
      // Перемещённый каталог ядро не снимает с наблюдения само
      if (header.mask & IN_MOVE_SELF) batch.movedWatches.push_back(header.wd);
      continue;
    }
    if ((header.mask & IN_ISDIR) || header.len == 0 || name[0] == '\0') continue;

    collector.incrementCounter(metrics::kWatchEvents);
    batch.files.push_back(folder->second / std::string(name));
  }
  return batch;
}

void DirectoryWatcher::start(const std::vector<fs::path> &folders,
                             const RuleList &rules) {
  auto &logger = CompositeLogger::instance();
  if (stopRequested()) {
    logger.info("DirectoryWatcher: stop requested before start");
    return;
  }

  InotifyDescriptor inotify;
  WatchTable watches;

  for (const auto &folder : folders) {
    const int wd = inotify_add_watch(inotify.get(), folder.c_str(), kFolderEvents);
    if (wd < 0) {
      logger.warning("DirectoryWatcher: cannot watch " + folder.string() +
                     ": " + std::strerror(errno));
      continue;
    }
    watches[wd] = folder;
    logger.info("DirectoryWatcher: watching " + folder.string());
  }

  if (watches.empty()) {
    logger.error("DirectoryWatcher: no folders could be watched");
    return;
  }

  running_ = true;
  logger.info("DirectoryWatcher: started with " +
              std::to_string(rules.size()) + " rule(s)");

  alignas(struct inotify_event) std::array<char, 64 * 1024> buffer{};
  std::vector<PendingFile> pending;

  while (!stopRequested()) {
    pollfd pfd{inotify.get(), POLLIN, 0};
    const int ready = poll(&pfd, 1, kPollTimeoutMs);
    if (ready < 0) {
      if (errno == EINTR) {
        logger.info("DirectoryWatcher: wait interrupted, stopping");
        break;
      }
      logger.error(std::string("DirectoryWatcher: poll failed: ") +
                   std::strerror(errno));
      break;
    }
    if (ready == 0) continue;

    const ssize_t length = read(inotify.get(), buffer.data(), buffer.size());
    if (length < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      logger.error(std::string("DirectoryWatcher: read failed: ") +
                   std::strerror(errno));
      break;
    }

    const auto readyAt = std::chrono::steady_clock::now() + settleDelay_;
    auto batch = decodeEvents(buffer.data(), static_cast<std::size_t>(length),
                              watches);
    for (const int wd : batch.movedWatches) {
      // Запись удалит последующее IN_IGNORED
      if (inotify_rm_watch(inotify.get(), wd) < 0) watches.erase(wd);
    }
    for (auto &file : batch.files) {
      pending.push_back({std::move(file), readyAt});
    }

    for (const auto &item : pending) {
      if (!settle(item.readyAt)) break;

      std::error_code ec;
      if (!fs::is_regular_file(fs::symlink_status(item.path, ec))) {
        logger.debug("DirectoryWatcher: ignoring " + item.path.string() +
                     " (gone or not a regular file)");
        continue;
      }
      dispatch(item.path, rules);
    }
    pending.clear();
  }

  running_ = false;
  logger.info("DirectoryWatcher: stopped");
}

}  // namespace kirei
