#include "../include/configmanager.hpp"

#include <stdexcept>

namespace kirei {

ConfigManager &ConfigManager::instance() {
  static ConfigManager instance;
  return instance;
}

void ConfigManager::initialize(const std::string &filename) {
  std::lock_guard<std::mutex> lock(configMutex_);

  try {
    nlohmann::json config = loader_.loadFromFile(filename);
    envProcessor_.process(config);

    if (!validator_.validateRoot(config)) {
      throw std::runtime_error("Invalid config structure");
    }

    std::shared_ptr<const EngineConfig> engineConfig =
        std::make_shared<EngineConfig>(EngineConfig::fromJson(config));

    baseConfig_ = std::move(config);
    engineConfig_ = std::move(engineConfig);
    configFilePath_ = filename;
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("Config initialization failed: ") +
                             e.what());
  }
}

bool ConfigManager::isInitialized() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return engineConfig_ != nullptr;
}

std::shared_ptr<const EngineConfig> ConfigManager::getEngineConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (!engineConfig_) {
    throw std::runtime_error("ConfigManager: configuration is not initialized");
  }
  return engineConfig_;
}

nlohmann::json ConfigManager::getLoggingConfig() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  if (baseConfig_.contains("logging") && baseConfig_["logging"].is_array()) {
    return baseConfig_["logging"];
  }
  return nlohmann::json::array();
}

std::string ConfigManager::getConfigFilePath() const {
  std::lock_guard<std::mutex> lock(configMutex_);
  return configFilePath_;
}

}  // namespace kirei
