/**
 * @file environmentprocessor.hpp
 * @brief Подстановка переменных окружения в JSON-конфигурацию
 *
 * @details
 * В каждом строковом узле документа шаблоны `$ENV{VAR}` заменяются значением
 * переменной окружения, а ведущий `~/` раскрывается в `$HOME/`. Это
 * позволяет писать пути каталогов вида "~/Downloads" прямо в конфигурации.
 *
 * @warning Шаблон остаётся без изменений, если переменная не установлена
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace kirei {

class EnvironmentProcessor {
 public:
  /**
   * @brief Выполняет подстановку во всех строковых узлах документа
   *
   * @code
   nlohmann::json cfg = R"({"monitorFolders": ["$ENV{HOME}/Downloads"]})"_json;
   EnvironmentProcessor().process(cfg);
   @endcode
   */
  void process(nlohmann::json &config) const;

  /// Заменяет все `$ENV{VAR}` в строке
  void resolveVariable(std::string &value) const;

  /// "~" и "~/x" -> "$HOME" и "$HOME/x"
  void expandHome(std::string &value) const;

 private:
  void walkJson(nlohmann::json &node,
                const std::function<void(std::string &)> &func) const;
};

}  // namespace kirei
