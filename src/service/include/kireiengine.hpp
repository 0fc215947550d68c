/**
 * @file kireiengine.hpp
 * @brief Управление жизненным циклом движка организации файлов
 *
 * @details
 * KireiEngine собирает правила из EngineConfig, запускает TaskScheduler и
 * затем DirectoryWatcher в вызывающем потоке. stop() можно вызвать из
 * любого потока (например, из обработчика сигнала): он останавливает
 * наблюдатель и планировщик, после чего start() возвращает управление.
 *
 * @code
 auto config = ConfigManager::instance().getEngineConfig();
 KireiEngine engine(config);
 SignalRouter::instance().registerHandler(SIGTERM,
                                          [&engine](int) { engine.stop(); });
 engine.start();  // до stop()
 @endcode
 */
#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "directorywatcher.hpp"
#include "engineconfig.hpp"
#include "taskscheduler.hpp"

namespace kirei {

struct EngineOptions {
  std::chrono::milliseconds settleDelay = DirectoryWatcher::kDefaultSettleDelay;
  std::chrono::milliseconds gracePeriod = TaskScheduler::kDefaultGracePeriod;
};

class KireiEngine {
 public:
  explicit KireiEngine(std::shared_ptr<const EngineConfig> config,
                       EngineOptions options = {});
  ~KireiEngine();

  KireiEngine(const KireiEngine &) = delete;
  KireiEngine &operator=(const KireiEngine &) = delete;

  /**
   * @brief Запустить планировщик и наблюдение; блокирует до остановки
   * @throw std::runtime_error Если наблюдение не удалось запустить
   * (планировщик к этому моменту уже остановлен)
   */
  void start();

  /// Идемпотентен, потокобезопасен, допустим до start()
  void stop() noexcept;

  bool isRunning() const;

  /// Одно правило ExtensionMoveStrategy на каждое seitonRules, в порядке конфигурации
  static DirectoryWatcher::RuleList buildSeitonRules(const EngineConfig &config);

  /// Задания Seiri, Seiso и поиска дубликатов
  static std::vector<ScheduledJob> buildJobs(const EngineConfig &config);

 private:
  std::shared_ptr<const EngineConfig> config_;
  DirectoryWatcher watcher_;
  TaskScheduler scheduler_;

  mutable std::mutex mutex_;
  bool started_ = false;
  bool stopped_ = false;
};

}  // namespace kirei
