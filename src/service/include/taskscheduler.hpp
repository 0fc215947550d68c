/**
 * @file taskscheduler.hpp
 * @brief Периодический запуск семейств правил (Seiri, Seiso, дубликаты)
 *
 * @details
 * Для каждого включённого семейства создаётся свой рабочий поток, так что
 * семейства выполняются независимо. Запуски идут с фиксированной частотой:
 * следующий момент отсчитывается от запланированного начала предыдущего
 * запуска, а не от его завершения. Если запуск длился дольше периода,
 * следующий начинается сразу.
 *
 * Правила одного семейства выполняются последовательно; исключение из
 * правила записывается в журнал и не мешает остальным правилам и
 * последующим запускам.
 *
 * Остановка: сначала новые запуски запрещаются и планировщик ждёт
 * завершения текущих не дольше gracePeriod, затем выставляет флаг отмены,
 * который правила проверяют через ScanContext::isCancelled().
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rulestrategy.hpp"

namespace kirei {

enum class TaskFamily { Seiri, Seiso, DuplicateDetection };

/// "seiri", "seiso", "duplicate_detection"
std::string toString(TaskFamily family);

struct ScheduledJob {
  TaskFamily family = TaskFamily::Seiri;
  bool enabled = false;
  std::chrono::milliseconds initialDelay{0};
  std::chrono::milliseconds period{0};
  std::vector<std::shared_ptr<ScheduledTaskStrategy>> strategies;
};

class TaskScheduler {
 public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::milliseconds kDefaultGracePeriod{30000};

  explicit TaskScheduler(
      std::vector<std::filesystem::path> monitoredFolders,
      std::chrono::milliseconds gracePeriod = kDefaultGracePeriod);
  ~TaskScheduler();

  TaskScheduler(const TaskScheduler &) = delete;
  TaskScheduler &operator=(const TaskScheduler &) = delete;

  /// Добавить задание; после startScheduler() не допускается
  void addJob(ScheduledJob job);

  /**
   * @brief Запустить рабочие потоки для включённых заданий
   * @note Повторный вызов и вызов после stopScheduler() игнорируются
   */
  void startScheduler();

  /**
   * @brief Упорядоченная, затем принудительная остановка
   *
   * Возвращает управление после завершения всех рабочих потоков.
   * Идемпотентна и безопасна до startScheduler().
   */
  void stopScheduler() noexcept;

  bool isRunning() const;

  /// Число заданий, для которых запущены рабочие потоки
  std::size_t scheduledJobs() const;

 private:
  void runJob(const ScheduledJob &job);
  void fire(const ScheduledJob &job);
  /// false, если за время ожидания поступил запрос остановки
  bool sleepUntil(Clock::time_point deadline);

  std::vector<std::filesystem::path> folders_;
  std::chrono::milliseconds gracePeriod_;
  std::vector<ScheduledJob> jobs_;
  std::vector<std::thread> workers_;

  mutable std::mutex mutex_;
  std::condition_variable wakeCv_;
  std::condition_variable idleCv_;
  bool stopRequested_ = false;
  std::size_t inFlight_ = 0;
  std::atomic<bool> cancelled_{false};

  // Сериализует запуск и остановку
  mutable std::mutex lifecycleMutex_;
  bool started_ = false;
  bool stopped_ = false;
};

}  // namespace kirei
