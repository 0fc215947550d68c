/**
 * @file engineconfig.hpp
 * @brief Неизменяемая модель конфигурации движка Kirei
 *
 * @details
 * Значения создаются один раз из проверенного JSON-документа
 * (EngineConfig::fromJson) и далее используются только для чтения
 * наблюдателем каталогов и планировщиком через
 * std::shared_ptr<const EngineConfig>.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "kirei/irotatablelogger.hpp"

namespace kirei {

enum class TimeUnit { Milliseconds, Seconds, Minutes, Hours, Days };

/// "SECONDS", "minutes", ... ; std::nullopt для неизвестной единицы
std::optional<TimeUnit> parseTimeUnit(const std::string &name);

std::chrono::milliseconds toDuration(std::int64_t amount, TimeUnit unit);

/**
 * @struct SeitonRule
 * @brief Правило сортировки новых файлов по расширению
 *
 * Расширения хранятся в нижнем регистре и без ведущей точки.
 */
struct SeitonRule {
  std::string name;
  std::vector<std::string> extensions;
  std::filesystem::path destination;

  /// @param extension расширение в нижнем регистре без точки
  bool matches(const std::string &extension) const;

  static SeitonRule fromJson(const nlohmann::json &src);
};

/**
 * @struct ScheduleConfig
 * @brief Параметры периодического запуска семейства задач
 */
struct ScheduleConfig {
  bool enabled = false;
  std::chrono::milliseconds initialDelay{0};
  std::chrono::milliseconds period{0};
  TimeUnit timeUnit = TimeUnit::Hours;

  static ScheduleConfig fromJson(const nlohmann::json &src);
};

// Seiri: перенос файлов, не изменявшихся дольше days суток
struct SeiriRule {
  bool enabled = false;
  std::int64_t days = 0;
  std::filesystem::path destination;
};

// Seiso: очистка временных каталогов
struct SeisoRule {
  bool enabled = false;
  std::vector<std::filesystem::path> folders;
};

enum class KeepStrategy { Newest, Oldest, Manual };

std::optional<KeepStrategy> parseKeepStrategy(const std::string &name);
std::string toString(KeepStrategy strategy);

/**
 * @struct DuplicateRules
 * @brief Фильтры и политика устранения дубликатов
 *
 * Граница размера, равная 0, означает отсутствие ограничения.
 */
struct DuplicateRules {
  std::uintmax_t minFileSizeBytes = 0;
  std::uintmax_t maxFileSizeBytes = 0;
  bool autoRemove = false;
  std::filesystem::path duplicatesDestination;
  KeepStrategy keepStrategy = KeepStrategy::Newest;
};

struct SeiriConfig {
  ScheduleConfig schedule;
  SeiriRule rule;
};

struct SeisoConfig {
  ScheduleConfig schedule;
  SeisoRule rule;
};

struct DuplicateDetectionConfig {
  ScheduleConfig schedule;
  DuplicateRules rules;
};

/**
 * @brief Параметры ротации файлового журнала из элемента массива logging
 *
 * @details
 * Необязательный объект "rotation":
 * @code
 * {"type": "size", "maxSizeBytes": 10485760, "maxBackups": 5}
 * {"type": "time", "intervalHours": 24}
 * @endcode
 * Без объекта rotation (или с type = "none") ротация выключена.
 * maxBackups по умолчанию 3.
 * @throw std::runtime_error При неизвестном type или неверных типах полей
 */
RotationConfig rotationFromJson(const nlohmann::json &loggerEntry);

struct EngineConfig {
  std::vector<std::filesystem::path> monitorFolders;
  std::vector<SeitonRule> seitonRules;
  SeiriConfig seiri;
  SeisoConfig seiso;
  DuplicateDetectionConfig duplicateDetection;

  /**
   * @brief Построить конфигурацию из JSON-документа
   * @throw std::runtime_error При отсутствии обязательных полей или неверных
   * типах
   * @note Семантические проверки (существование каталогов и т.п.) выполняет
   * ConfigValidator до вызова этого метода
   */
  static EngineConfig fromJson(const nlohmann::json &src);
};

}  // namespace kirei
