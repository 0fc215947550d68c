/**
 * @file argumentparser.hpp
 * @brief Разбор аргументов командной строки kirei_service
 *
 * @details
 * Поддерживаются формы `--opt=value` и `--opt value`. Неизвестный аргумент
 * или недопустимое значение приводят к std::invalid_argument.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kirei {

struct ParsedArgs {
  std::string config_path = "config/kirei.json";
  std::vector<std::string> logger_types;
  std::optional<std::string> log_level;
  bool help_message = false;
  bool version_message = false;
  /// Логирование задано в командной строке, секция "logging" не используется
  bool use_cli_logging = false;
};

class ArgumentParser {
 public:
  /**
   * @throw std::invalid_argument При неизвестном аргументе, отсутствующем
   * или недопустимом значении
   */
  ParsedArgs parse(int argc, char **argv);

 private:
  static const std::vector<std::string> validLogLevels;
  static const std::vector<std::string> validLogTypes;

  /// Значение после '=' или следующий аргумент
  static std::string optionValue(const std::string &arg,
                                 const std::string &option, int &i, int argc,
                                 char **argv);
  static bool isOption(const std::string &arg, const std::string &option);

  void parseLogType(const std::string &arg, ParsedArgs &args, int &i, int argc,
                    char **argv);
  void parseConfigFile(const std::string &arg, ParsedArgs &args, int &i,
                       int argc, char **argv);
  void parseLogLevel(const std::string &arg, ParsedArgs &args, int &i, int argc,
                     char **argv);
  void validateLogTypes(const std::vector<std::string> &types);
};

}  // namespace kirei
