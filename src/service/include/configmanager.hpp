/**
 * @file configmanager.hpp
 * @brief Единая точка загрузки конфигурации движка
 *
 * @details
 * Цепочка обработки: ConfigLoader (чтение JSON) -> EnvironmentProcessor
 * (подстановка $ENV{} и ~/) -> ConfigValidator -> EngineConfig::fromJson.
 * Конфигурация загружается один раз при запуске и далее не изменяется.
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "configloader.hpp"
#include "configvalidator.hpp"
#include "engineconfig.hpp"
#include "environmentprocessor.hpp"

namespace kirei {

class ConfigManager {
 public:
  static ConfigManager &instance();

  /**
   * @brief Загрузить, проверить и преобразовать файл конфигурации
   * @throw std::runtime_error С текстом "Config initialization failed: ..."
   *
   * @code
   auto &mgr = kirei::ConfigManager::instance();
   mgr.initialize("config/kirei.json");
   auto engineConfig = mgr.getEngineConfig();
   @endcode
   */
  void initialize(const std::string &filename);

  bool isInitialized() const;

  /// @throw std::runtime_error Если initialize() ещё не вызывался
  std::shared_ptr<const EngineConfig> getEngineConfig() const;

  /// Массив logging из файла; пустой массив, если секции нет
  nlohmann::json getLoggingConfig() const;

  std::string getConfigFilePath() const;

 private:
  ConfigManager() = default;
  ~ConfigManager() = default;
  ConfigManager(const ConfigManager &) = delete;
  ConfigManager &operator=(const ConfigManager &) = delete;

  mutable std::mutex configMutex_;
  ConfigLoader loader_;
  EnvironmentProcessor envProcessor_;
  ConfigValidator validator_;
  nlohmann::json baseConfig_;
  std::shared_ptr<const EngineConfig> engineConfig_;
  std::string configFilePath_;
};

}  // namespace kirei
