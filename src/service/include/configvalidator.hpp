/**
 * @file configvalidator.hpp
 * @brief Проверка структуры и семантики конфигурации движка
 *
 * @details
 * Каждый метод возвращает true для корректного фрагмента и бросает
 * std::runtime_error с префиксом "ConfigValidator:" при первой найденной
 * ошибке. Проверяются:
 * - список monitorFolders (не пуст, каталоги существуют, не повторяются
 *   и не вложены друг в друга);
 * - правила Seiton (имя, непустой список расширений, каталог назначения);
 * - блоки расписания seiriConfig, seisoConfig, duplicateDetectionConfig;
 * - правила поиска дубликатов (keepStrategy, границы размера);
 * - массив logging и параметры ротации файловых логгеров.
 */
#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace kirei {

class ConfigValidator {
 public:
  /// Полная проверка документа
  bool validateRoot(const nlohmann::json &config) const;

  bool validateMonitorFolders(const nlohmann::json &folders) const;
  bool validateSeitonRules(const nlohmann::json &rules) const;

  /**
   * @brief Проверка блока расписания семейства задач
   * @param block  JSON-объект (например, config["seisoConfig"])
   * @param family Имя блока для сообщений об ошибках
   * @note Отключённый блок (enabled = false) не проверяется
   */
  bool validateSchedule(const nlohmann::json &block,
                        const std::string &family) const;

  bool validateSeiri(const nlohmann::json &seiri) const;
  bool validateSeiso(const nlohmann::json &seiso) const;
  bool validateDuplicateDetection(const nlohmann::json &duplicate) const;
  bool validateLogging(const nlohmann::json &logging) const;
  bool validateRotation(const nlohmann::json &rotation) const;

 private:
  static bool isBlank(const nlohmann::json &value);
};

}  // namespace kirei
