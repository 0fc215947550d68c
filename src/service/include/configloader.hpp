/**
 * @file configloader.hpp
 * @brief Загрузчик конфигурации движка из JSON-файла
 *
 * @details
 * Читает файл целиком и разбирает его средствами nlohmann/json. Ошибки
 * открытия файла и синтаксические ошибки JSON превращаются в
 * std::runtime_error с префиксом "ConfigLoader:" и, для ошибок разбора,
 * смещением в байтах.
 */
#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace kirei {

/**
 * @class ConfigLoader
 * @brief Чтение и разбор JSON-файла конфигурации
 *
 * @note Класс не потокобезопасен; ConfigManager вызывает его под своим
 * мьютексом
 */
class ConfigLoader {
 public:
  ConfigLoader() = default;
  ~ConfigLoader() = default;

  /**
   * @brief Загружает конфигурацию из указанного JSON-файла
   * @param[in] filename Путь к файлу (относительный или абсолютный)
   * @return Разобранный документ
   * @throw std::runtime_error Файл не открывается или содержит неверный JSON
   *
   * @code
   kirei::ConfigLoader loader;
   auto config = loader.loadFromFile("config/kirei.json");
   @endcode
   */
  nlohmann::json loadFromFile(const std::string &filename);

  /**
   * @brief Разбирает конфигурацию из строки
   * @throw std::runtime_error При синтаксической ошибке
   */
  nlohmann::json loadFromString(const std::string &content) const;

  std::string getLastLoadedFile() const;
  bool hasLoadedFile() const;

 private:
  nlohmann::json readFileContents(const std::string &filename) const;

  std::string lastLoadedFile;
};

}  // namespace kirei
