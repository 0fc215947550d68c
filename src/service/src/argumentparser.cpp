/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 */

#include "../include/argumentparser.hpp"

#include <algorithm>
#include <cctype>

using namespace std;

namespace kirei {

const vector<string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const vector<string> ArgumentParser::validLogTypes = {"console", "sync_file",
                                                      "async_file"};

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
  ParsedArgs args;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help_message = true;
    } else if (arg == "--version" || arg == "-v") {
      args.version_message = true;
    } else if (isOption(arg, "--log-type")) {
      parseLogType(arg, args, i, argc, argv);
    } else if (isOption(arg, "--config-file")) {
      parseConfigFile(arg, args, i, argc, argv);
    } else if (isOption(arg, "--log-level")) {
      parseLogLevel(arg, args, i, argc, argv);
    } else {
      throw invalid_argument("ArgumentParser: Unknown argument: " + arg);
    }
  }

  validateLogTypes(args.logger_types);
  return args;
}

bool ArgumentParser::isOption(const string &arg, const string &option) {
  return arg == option || arg.compare(0, option.size() + 1, option + "=") == 0;
}

string ArgumentParser::optionValue(const string &arg, const string &option,
                                   int &i, int argc, char **argv) {
  size_t eqPos = arg.find('=');
  string value;
  if (eqPos != string::npos) {
    value = arg.substr(eqPos + 1);
  } else if (i + 1 < argc) {
    value = argv[++i];
  } else {
    throw invalid_argument("ArgumentParser: " + option + " requires a value");
  }

  if (value.empty()) {
    throw invalid_argument("ArgumentParser: " + option + " requires a value");
  }
  return value;
}

void ArgumentParser::parseLogType(const string &arg, ParsedArgs &args, int &i,
                                  int argc, char **argv) {
  string value = optionValue(arg, "--log-type", i, argc, argv);

  size_t pos = 0;
  while ((pos = value.find(',')) != string::npos) {
    string type = value.substr(0, pos);
    if (!type.empty()) args.logger_types.push_back(type);
    value.erase(0, pos + 1);
  }

  if (!value.empty()) {
    args.logger_types.push_back(value);
  }

  args.use_cli_logging = true;
}

void ArgumentParser::parseConfigFile(const string &arg, ParsedArgs &args,
                                     int &i, int argc, char **argv) {
  args.config_path = optionValue(arg, "--config-file", i, argc, argv);
}

void ArgumentParser::parseLogLevel(const string &arg, ParsedArgs &args, int &i,
                                   int argc, char **argv) {
  string value = optionValue(arg, "--log-level", i, argc, argv);
  transform(value.begin(), value.end(), value.begin(),
            [](unsigned char c) { return tolower(c); });

  if (find(validLogLevels.begin(), validLogLevels.end(), value) ==
      validLogLevels.end()) {
    throw invalid_argument("ArgumentParser: Invalid log level: " + value);
  }

  args.log_level = value;
  args.use_cli_logging = true;
}

void ArgumentParser::validateLogTypes(const vector<string> &types) {
  for (const auto &type : types) {
    if (find(validLogTypes.begin(), validLogTypes.end(), type) ==
        validLogTypes.end()) {
      throw invalid_argument("ArgumentParser: Invalid logger type: " + type);
    }
  }
}

}  // namespace kirei
