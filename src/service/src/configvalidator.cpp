#include "../include/configvalidator.hpp"

#include <algorithm>
#include <filesystem>
#include <vector>

#include "../include/engineconfig.hpp"
#include "../include/pathutils.hpp"
#include "kirei/compositelogger.hpp"

using namespace std;

namespace kirei {

bool ConfigValidator::isBlank(const nlohmann::json &value) {
  if (!value.is_string()) return true;
  const string s = value.get<string>();
  return s.find_first_not_of(" \t\r\n") == string::npos;
}

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
  if (!config.is_object()) {
    throw runtime_error("ConfigValidator: Configuration root must be an object");
  }

  if (!config.contains("monitorFolders")) {
    throw runtime_error(
        "ConfigValidator: Missing required section: monitorFolders");
  }
  validateMonitorFolders(config["monitorFolders"]);

  if (config.contains("seitonRules")) {
    validateSeitonRules(config["seitonRules"]);
  } else {
    CompositeLogger::instance().warning(
        "No Seiton rules configured; real-time organization is disabled");
  }

  if (config.contains("seiriConfig")) validateSeiri(config["seiriConfig"]);
  if (config.contains("seisoConfig")) validateSeiso(config["seisoConfig"]);
  if (config.contains("duplicateDetectionConfig")) {
    validateDuplicateDetection(config["duplicateDetectionConfig"]);
  }
  if (config.contains("logging")) validateLogging(config["logging"]);

  return true;
}

bool ConfigValidator::validateMonitorFolders(
    const nlohmann::json &folders) const {
  if (!folders.is_array() || folders.empty()) {
    throw runtime_error(
        "ConfigValidator: monitorFolders must be a non-empty array");
  }

  vector<filesystem::path> accepted;
  for (const auto &folder : folders) {
    if (isBlank(folder)) {
      throw runtime_error(
          "ConfigValidator: monitorFolders entries must be non-empty strings");
    }
    const filesystem::path path(folder.get<string>());
    std::error_code ec;
    if (!filesystem::exists(path, ec)) {
      throw runtime_error("ConfigValidator: Monitored folder does not exist: " +
                          path.string());
    }
    if (!filesystem::is_directory(path, ec)) {
      throw runtime_error(
          "ConfigValidator: Monitored path is not a directory: " +
          path.string());
    }

    auto canonical = filesystem::weakly_canonical(path, ec);
    if (ec) canonical = path.lexically_normal();
    for (const auto &other : accepted) {
      if (isWithin(canonical, other) || isWithin(other, canonical)) {
        throw runtime_error(
            "ConfigValidator: Monitored folders must not repeat or nest: " +
            path.string() + " overlaps " + other.string());
      }
    }
    accepted.push_back(canonical);
  }
  return true;
}

bool ConfigValidator::validateSeitonRules(const nlohmann::json &rules) const {
  if (!rules.is_array()) {
    throw runtime_error("ConfigValidator: seitonRules must be an array");
  }
  if (rules.empty()) {
    CompositeLogger::instance().warning(
        "No Seiton rules configured; real-time organization is disabled");
    return true;
  }

  for (const auto &rule : rules) {
    if (!rule.is_object()) {
      throw runtime_error("ConfigValidator: Seiton rule must be an object");
    }
    if (!rule.contains("name") || isBlank(rule["name"])) {
      throw runtime_error("ConfigValidator: Seiton rule missing name");
    }
    const string name = rule["name"].get<string>();

    if (!rule.contains("extensions") || !rule["extensions"].is_array() ||
        rule["extensions"].empty()) {
      throw runtime_error("ConfigValidator: Seiton rule '" + name +
                          "' must list at least one extension");
    }
    for (const auto &ext : rule["extensions"]) {
      if (isBlank(ext)) {
        throw runtime_error("ConfigValidator: Seiton rule '" + name +
                            "' has an empty extension");
      }
    }

    if (!rule.contains("destination") || isBlank(rule["destination"])) {
      throw runtime_error("ConfigValidator: Seiton rule '" + name +
                          "' missing destination");
    }
  }
  return true;
}

bool ConfigValidator::validateSchedule(const nlohmann::json &block,
                                       const string &family) const {
  if (!block.is_object()) {
    throw runtime_error("ConfigValidator: " + family + " must be an object");
  }
  if (block.contains("enabled") && !block["enabled"].is_boolean()) {
    throw runtime_error("ConfigValidator: " + family +
                        ".enabled must be a boolean");
  }
  if (!block.value("enabled", false)) return true;

  if (!block.contains("period") || !block["period"].is_number_integer() ||
      block["period"].get<long long>() <= 0) {
    throw runtime_error("ConfigValidator: " + family +
                        ".period must be a positive integer");
  }
  if (block.contains("initialDelay") &&
      (!block["initialDelay"].is_number_integer() ||
       block["initialDelay"].get<long long>() < 0)) {
    throw runtime_error("ConfigValidator: " + family +
                        ".initialDelay must be a non-negative integer");
  }
  if (!block.contains("timeUnit") || !block["timeUnit"].is_string() ||
      !parseTimeUnit(block["timeUnit"].get<string>())) {
    throw runtime_error("ConfigValidator: " + family +
                        ".timeUnit must be one of MILLISECONDS, SECONDS, "
                        "MINUTES, HOURS, DAYS");
  }
  return true;
}

bool ConfigValidator::validateSeiri(const nlohmann::json &seiri) const {
  validateSchedule(seiri, "seiriConfig");
  if (!seiri.value("enabled", false)) return true;

  if (!seiri.contains("rules") || !seiri["rules"].is_object() ||
      !seiri["rules"].contains("moveFilesNotAccessedForDays") ||
      !seiri["rules"]["moveFilesNotAccessedForDays"].is_object()) {
    throw runtime_error(
        "ConfigValidator: seiriConfig.rules.moveFilesNotAccessedForDays is "
        "required when Seiri is enabled");
  }

  const auto &rule = seiri["rules"]["moveFilesNotAccessedForDays"];
  if (!rule.value("enabled", false)) return true;

  if (!rule.contains("destination") || isBlank(rule["destination"])) {
    throw runtime_error(
        "ConfigValidator: moveFilesNotAccessedForDays.destination is required");
  }
  if (!rule.contains("days") || !rule["days"].is_number_integer() ||
      rule["days"].get<long long>() < 0) {
    throw runtime_error(
        "ConfigValidator: moveFilesNotAccessedForDays.days must be a "
        "non-negative integer");
  }
  return true;
}

bool ConfigValidator::validateSeiso(const nlohmann::json &seiso) const {
  validateSchedule(seiso, "seisoConfig");
  if (!seiso.value("enabled", false)) return true;

  if (!seiso.contains("rules") || !seiso["rules"].is_object()) return true;
  const auto &rules = seiso["rules"];
  if (!rules.contains("cleanTemporaryFolders")) return true;

  const auto &clean = rules["cleanTemporaryFolders"];
  if (clean.contains("folders") && !clean["folders"].is_array()) {
    throw runtime_error(
        "ConfigValidator: cleanTemporaryFolders.folders must be an array");
  }
  return true;
}

bool ConfigValidator::validateDuplicateDetection(
    const nlohmann::json &duplicate) const {
  validateSchedule(duplicate, "duplicateDetectionConfig");
  if (!duplicate.contains("rules")) return true;

  const auto &rules = duplicate["rules"];
  if (!rules.is_object()) {
    throw runtime_error(
        "ConfigValidator: duplicateDetectionConfig.rules must be an object");
  }

  for (const char *key : {"minFileSizeBytes", "maxFileSizeBytes"}) {
    if (rules.contains(key) && (!rules[key].is_number_integer() ||
                                rules[key].get<long long>() < 0)) {
      throw runtime_error(string("ConfigValidator: ") + key +
                          " must be a non-negative integer");
    }
  }
  const long long minSize = rules.value("minFileSizeBytes", 0LL);
  const long long maxSize = rules.value("maxFileSizeBytes", 0LL);
  if (maxSize > 0 && maxSize < minSize) {
    throw runtime_error(
        "ConfigValidator: maxFileSizeBytes must not be below "
        "minFileSizeBytes");
  }

  if (rules.contains("keepStrategy")) {
    if (!rules["keepStrategy"].is_string() ||
        !parseKeepStrategy(rules["keepStrategy"].get<string>())) {
      throw runtime_error(
          "ConfigValidator: keepStrategy must be NEWEST, OLDEST or MANUAL");
    }
  }
  if (rules.contains("duplicatesDestination") &&
      !rules["duplicatesDestination"].is_string() &&
      !rules["duplicatesDestination"].is_null()) {
    throw runtime_error(
        "ConfigValidator: duplicatesDestination must be a string");
  }
  return true;
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
  if (!logging.is_array()) {
    throw runtime_error("ConfigValidator: Logging config must be an array");
  }

  const vector<string> valid_types = {"console", "sync_file", "async_file"};

  for (const auto &logger : logging) {
    if (!logger.is_object()) {
      throw runtime_error("ConfigValidator: Logger entry must be an object");
    }

    if (!logger.contains("type") || !logger["type"].is_string()) {
      throw runtime_error("ConfigValidator: Logger missing type field");
    }

    const string type = logger["type"].get<string>();
    if (find(valid_types.begin(), valid_types.end(), type) ==
        valid_types.end()) {
      throw runtime_error("ConfigValidator: Invalid logger type: " + type);
    }

    if (logger.contains("level") && !logger["level"].is_string()) {
      throw runtime_error("ConfigValidator: Invalid log level type");
    }

    if ((type == "sync_file" || type == "async_file") &&
        (!logger.contains("file") || !logger["file"].is_string())) {
      throw runtime_error("ConfigValidator: File logger missing file path");
    }

    if (logger.contains("rotation")) {
      if (type == "console") {
        throw runtime_error(
            "ConfigValidator: Rotation is only supported for file loggers");
      }
      validateRotation(logger["rotation"]);
    }
  }
  return true;
}

bool ConfigValidator::validateRotation(const nlohmann::json &rotation) const {
  if (!rotation.is_object()) {
    throw runtime_error("ConfigValidator: rotation must be an object");
  }
  if (!rotation.contains("type") || !rotation["type"].is_string() ||
      !rotationTypeFromString(rotation["type"].get<string>())) {
    throw runtime_error(
        "ConfigValidator: rotation.type must be one of size, time, none");
  }

  auto positive = [&rotation](const char *key) {
    return rotation.contains(key) && rotation[key].is_number_integer() &&
           rotation[key].get<long long>() > 0;
  };

  const auto type = *rotationTypeFromString(rotation["type"].get<string>());
  if (type == RotationType::SIZE && !positive("maxSizeBytes")) {
    throw runtime_error(
        "ConfigValidator: rotation.maxSizeBytes must be a positive integer");
  }
  if (type == RotationType::TIME && !positive("intervalHours")) {
    throw runtime_error(
        "ConfigValidator: rotation.intervalHours must be a positive integer");
  }
  if (rotation.contains("maxBackups") && !positive("maxBackups")) {
    throw runtime_error(
        "ConfigValidator: rotation.maxBackups must be a positive integer");
  }
  return true;
}

}  // namespace kirei
