#include "../include/kireiengine.hpp"

#include <stdexcept>

#include "../include/agebasedmovestrategy.hpp"
#include "../include/duplicatedetectionstrategy.hpp"
#include "../include/enginemetrics.hpp"
#include "../include/extensionmovestrategy.hpp"
#include "../include/tempfoldercleanupstrategy.hpp"
#include "kirei/compositelogger.hpp"

namespace kirei {

namespace {

ScheduledJob makeJob(TaskFamily family, const ScheduleConfig &schedule) {
  ScheduledJob job;
  job.family = family;
  job.enabled = schedule.enabled;
  job.initialDelay = schedule.initialDelay;
  job.period = schedule.period;
  return job;
}

}  // namespace

KireiEngine::KireiEngine(std::shared_ptr<const EngineConfig> config,
                         EngineOptions options)
    : config_(std::move(config)),
      watcher_(options.settleDelay),
      scheduler_(config_ ? config_->monitorFolders
                         : std::vector<std::filesystem::path>{},
                 options.gracePeriod) {
  if (!config_) {
    throw std::invalid_argument("KireiEngine: configuration is null");
  }
}

KireiEngine::~KireiEngine() { stop(); }

DirectoryWatcher::RuleList KireiEngine::buildSeitonRules(
    const EngineConfig &config) {
  DirectoryWatcher::RuleList rules;
  rules.reserve(config.seitonRules.size());
  for (const auto &rule : config.seitonRules) {
    rules.push_back(std::make_shared<ExtensionMoveStrategy>(rule));
  }
  return rules;
}

std::vector<ScheduledJob> KireiEngine::buildJobs(const EngineConfig &config) {
  std::vector<ScheduledJob> jobs;

  auto seiri = makeJob(TaskFamily::Seiri, config.seiri.schedule);
  seiri.strategies.push_back(
      std::make_shared<AgeBasedMoveStrategy>(config.seiri.rule));
  jobs.push_back(std::move(seiri));

  auto seiso = makeJob(TaskFamily::Seiso, config.seiso.schedule);
  seiso.strategies.push_back(
      std::make_shared<TempFolderCleanupStrategy>(config.seiso.rule));
  jobs.push_back(std::move(seiso));

  auto duplicates = makeJob(TaskFamily::DuplicateDetection,
                            config.duplicateDetection.schedule);
  duplicates.strategies.push_back(std::make_shared<DuplicateDetectionStrategy>(
      config.duplicateDetection.rules));
  jobs.push_back(std::move(duplicates));

  return jobs;
}

void KireiEngine::start() {
  auto &logger = CompositeLogger::instance();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopped_) {
      logger.warning("KireiEngine: start ignored, engine already started or stopped");
      return;
    }
    started_ = true;
  }

  metrics::registerEngineMetrics();
  logger.info("KireiEngine: starting, " +
              std::to_string(config_->monitorFolders.size()) +
              " monitored folder(s), " +
              std::to_string(config_->seitonRules.size()) + " Seiton rule(s)");

  for (auto &job : buildJobs(*config_)) {
    scheduler_.addJob(std::move(job));
  }
  scheduler_.startScheduler();

  try {
    watcher_.start(config_->monitorFolders, buildSeitonRules(*config_));
  } catch (const std::exception &e) {
    logger.critical(std::string("KireiEngine: watcher failed: ") + e.what());
    stop();
    throw;
  }

  stop();
}

void KireiEngine::stop() noexcept {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    first = !stopped_;
    stopped_ = true;
  }

  auto &logger = CompositeLogger::instance();
  if (first) logger.info("KireiEngine: stopping");
  watcher_.stop();
  // Повторный вызов дожидается остановки, начатой другим потоком
  scheduler_.stopScheduler();
  if (first) logger.info("KireiEngine: stopped");
}

bool KireiEngine::isRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_ && !stopped_;
}

}  // namespace kirei
