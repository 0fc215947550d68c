/**
 * @file rulestrategy.hpp
 * @brief Интерфейсы правил организации файлов
 *
 * @details
 * Правила двух видов:
 * - RuleStrategy применяется наблюдателем каталогов к одному новому файлу
 *   (Seiton);
 * - ScheduledTaskStrategy запускается планировщиком и обходит все
 *   наблюдаемые каталоги (Seiri, Seiso, поиск дубликатов).
 *
 * Ошибки отдельных файлов правило обрабатывает само: записывает в журнал и
 * пропускает файл. Исключение, всё же вышедшее из правила, перехватывает
 * вызывающая сторона.
 */
#pragma once

#include <atomic>
#include <filesystem>
#include <string>
#include <vector>

namespace kirei {

/**
 * @struct ScanContext
 * @brief Входные данные одного запуска периодического правила
 */
struct ScanContext {
  std::vector<std::filesystem::path> monitoredFolders;
  /// Момент запуска, относительно которого считается возраст файлов
  std::filesystem::file_time_type now = std::filesystem::file_time_type::clock::now();
  /// Флаг принудительной остановки планировщика; может быть nullptr
  const std::atomic<bool> *cancelled = nullptr;

  bool isCancelled() const { return cancelled != nullptr && cancelled->load(); }
};

class RuleStrategy {
 public:
  virtual ~RuleStrategy() = default;

  /**
   * @brief Проверить файл и, если правило подходит, выполнить действие
   * @return true, если правило подошло к файлу (даже если перемещение не
   * удалось); false, если правило файл не касается
   */
  virtual bool apply(const std::filesystem::path &file) = 0;

  virtual std::string name() const = 0;
};

class ScheduledTaskStrategy {
 public:
  virtual ~ScheduledTaskStrategy() = default;

  virtual void execute(const ScanContext &context) = 0;

  virtual std::string name() const = 0;
};

}  // namespace kirei
