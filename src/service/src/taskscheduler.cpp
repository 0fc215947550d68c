#include "../include/taskscheduler.hpp"

#include "../include/enginemetrics.hpp"
#include "kirei/MetricsCollector.hpp"
#include "kirei/compositelogger.hpp"

namespace kirei {

std::string toString(TaskFamily family) {
  switch (family) {
    case TaskFamily::Seiri:
      return "seiri";
    case TaskFamily::Seiso:
      return "seiso";
    case TaskFamily::DuplicateDetection:
      return "duplicate_detection";
  }
  return "unknown";
}

TaskScheduler::TaskScheduler(std::vector<std::filesystem::path> monitoredFolders,
                             std::chrono::milliseconds gracePeriod)
    : folders_(std::move(monitoredFolders)), gracePeriod_(gracePeriod) {}

TaskScheduler::~TaskScheduler() { stopScheduler(); }

void TaskScheduler::addJob(ScheduledJob job) {
  std::lock_guard<std::mutex> lock(lifecycleMutex_);
  if (started_ || stopped_) {
    CompositeLogger::instance().warning(
        "TaskScheduler: cannot add job " + toString(job.family) +
        " after the scheduler was started");
    return;
  }
  jobs_.push_back(std::move(job));
}

void TaskScheduler::startScheduler() {
  auto &logger = CompositeLogger::instance();
  std::lock_guard<std::mutex> lock(lifecycleMutex_);

  if (started_ || stopped_) {
    logger.warning("TaskScheduler: already started or stopped");
    return;
  }
  started_ = true;

  for (const auto &job : jobs_) {
    const std::string family = toString(job.family);
    if (!job.enabled) {
      logger.info("TaskScheduler: " + family + " is disabled");
      continue;
    }
    if (job.period.count() <= 0) {
      logger.error("TaskScheduler: " + family +
                   " has a non-positive period, not scheduled");
      continue;
    }
    if (job.strategies.empty()) {
      logger.warning("TaskScheduler: " + family + " has no strategies");
      continue;
    }

    logger.info("TaskScheduler: " + family + " scheduled, initial delay " +
                std::to_string(job.initialDelay.count()) + "ms, period " +
                std::to_string(job.period.count()) + "ms");
    workers_.emplace_back(&TaskScheduler::runJob, this, std::cref(job));
  }

  logger.info("TaskScheduler: started with " +
              std::to_string(workers_.size()) + " job(s)");
}

void TaskScheduler::stopScheduler() noexcept {
  auto &logger = CompositeLogger::instance();
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  if (stopped_) return;
  stopped_ = true;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopRequested_ = true;
  }
  wakeCv_.notify_all();

  if (!started_) return;

  logger.info("TaskScheduler: stopping");
  {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool idle = idleCv_.wait_for(lock, gracePeriod_,
                                       [this] { return inFlight_ == 0; });
    if (!idle) {
      logger.warning("TaskScheduler: tasks still running after " +
                     std::to_string(gracePeriod_.count()) +
                     "ms, forcing cancellation");
      cancelled_ = true;
    }
  }

  for (auto &worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
  logger.info("TaskScheduler: stopped");
}

bool TaskScheduler::isRunning() const {
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  return started_ && !stopped_;
}

std::size_t TaskScheduler::scheduledJobs() const {
  std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
  return workers_.size();
}

bool TaskScheduler::sleepUntil(Clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  return !wakeCv_.wait_until(lock, deadline, [this] { return stopRequested_; });
}

void TaskScheduler::runJob(const ScheduledJob &job) {
  auto next = Clock::now() + job.initialDelay;
  while (sleepUntil(next)) {
    fire(job);
    // Фиксированная частота: от запланированного, а не фактического начала
    next += job.period;
  }
}

void TaskScheduler::fire(const ScheduledJob &job) {
  auto &logger = CompositeLogger::instance();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopRequested_) return;
    ++inFlight_;
  }

  const std::string family = toString(job.family);
  logger.debug("TaskScheduler: running " + family);
  const auto started = Clock::now();

  ScanContext context;
  context.monitoredFolders = folders_;
  context.now = std::filesystem::file_time_type::clock::now();
  context.cancelled = &cancelled_;

  for (const auto &strategy : job.strategies) {
    if (context.isCancelled()) break;
    try {
      strategy->execute(context);
    } catch (const std::exception &e) {
      MetricsCollector::instance().incrementCounter(metrics::kStrategyFailures);
      logger.error("TaskScheduler: strategy " + strategy->name() +
                   " failed: " + e.what());
    } catch (...) {
      MetricsCollector::instance().incrementCounter(metrics::kStrategyFailures);
      logger.error("TaskScheduler: strategy " + strategy->name() +
                   " failed with a non-standard exception");
    }
  }

  MetricsCollector::instance().recordTaskTime(
      family + "_run", std::chrono::duration_cast<std::chrono::milliseconds>(
                           Clock::now() - started));

  {
    std::lock_guard<std::mutex> lock(mutex_);
    --inFlight_;
  }
  idleCv_.notify_all();
}

}  // namespace kirei
