#include "../include/engineconfig.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "../include/pathutils.hpp"

namespace kirei {

namespace {

std::string upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return value;
}

const nlohmann::json &emptyObject() {
  static const nlohmann::json empty = nlohmann::json::object();
  return empty;
}

const nlohmann::json &section(const nlohmann::json &src, const char *key) {
  if (src.contains(key) && src[key].is_object()) return src[key];
  return emptyObject();
}

std::int64_t integerField(const nlohmann::json &src, const char *key,
                          std::int64_t fallback) {
  if (!src.contains(key)) return fallback;
  if (!src[key].is_number_integer()) {
    throw std::runtime_error(std::string("Field '") + key +
                             "' must be an integer");
  }
  return src[key].get<std::int64_t>();
}

std::filesystem::path pathField(const nlohmann::json &src, const char *key) {
  if (!src.contains(key) || src[key].is_null()) return {};
  if (!src[key].is_string()) {
    throw std::runtime_error(std::string("Field '") + key +
                             "' must be a string");
  }
  return std::filesystem::path(src[key].get<std::string>());
}

}  // namespace

std::optional<TimeUnit> parseTimeUnit(const std::string &name) {
  const std::string key = upper(name);
  if (key == "MILLISECONDS") return TimeUnit::Milliseconds;
  if (key == "SECONDS") return TimeUnit::Seconds;
  if (key == "MINUTES") return TimeUnit::Minutes;
  if (key == "HOURS") return TimeUnit::Hours;
  if (key == "DAYS") return TimeUnit::Days;
  return std::nullopt;
}

std::chrono::milliseconds toDuration(std::int64_t amount, TimeUnit unit) {
  using namespace std::chrono;
  switch (unit) {
    case TimeUnit::Milliseconds:
      return milliseconds(amount);
    case TimeUnit::Seconds:
      return duration_cast<milliseconds>(seconds(amount));
    case TimeUnit::Minutes:
      return duration_cast<milliseconds>(minutes(amount));
    case TimeUnit::Hours:
      return duration_cast<milliseconds>(hours(amount));
    case TimeUnit::Days:
      return duration_cast<milliseconds>(hours(24 * amount));
  }
  return milliseconds(amount);
}

std::optional<KeepStrategy> parseKeepStrategy(const std::string &name) {
  const std::string key = upper(name);
  if (key == "NEWEST") return KeepStrategy::Newest;
  if (key == "OLDEST") return KeepStrategy::Oldest;
  if (key == "MANUAL") return KeepStrategy::Manual;
  return std::nullopt;
}

std::string toString(KeepStrategy strategy) {
  switch (strategy) {
    case KeepStrategy::Newest:
      return "NEWEST";
    case KeepStrategy::Oldest:
      return "OLDEST";
    case KeepStrategy::Manual:
      return "MANUAL";
  }
  return "NEWEST";
}

bool SeitonRule::matches(const std::string &extension) const {
  return std::find(extensions.begin(), extensions.end(), extension) !=
         extensions.end();
}

SeitonRule SeitonRule::fromJson(const nlohmann::json &src) {
  SeitonRule rule;

  if (!src.contains("name") || !src["name"].is_string()) {
    throw std::runtime_error("Seiton rule missing required 'name' field");
  }
  rule.name = src["name"].get<std::string>();

  if (!src.contains("extensions") || !src["extensions"].is_array()) {
    throw std::runtime_error("Seiton rule '" + rule.name +
                             "' missing required 'extensions' array");
  }
  for (const auto &ext : src["extensions"]) {
    if (!ext.is_string()) {
      throw std::runtime_error("Seiton rule '" + rule.name +
                               "' has a non-string extension");
    }
    std::string normalized = normalizeExtension(ext.get<std::string>());
    if (!normalized.empty()) rule.extensions.push_back(std::move(normalized));
  }

  if (!src.contains("destination") || !src["destination"].is_string()) {
    throw std::runtime_error("Seiton rule '" + rule.name +
                             "' missing required 'destination' field");
  }
  rule.destination = src["destination"].get<std::string>();

  return rule;
}

ScheduleConfig ScheduleConfig::fromJson(const nlohmann::json &src) {
  ScheduleConfig config;
  config.enabled = src.value("enabled", false);

  const std::string unitName = src.value("timeUnit", std::string("HOURS"));
  auto unit = parseTimeUnit(unitName);
  if (!unit) {
    throw std::runtime_error("Unknown timeUnit: " + unitName);
  }
  config.timeUnit = *unit;
  config.initialDelay = toDuration(integerField(src, "initialDelay", 0), *unit);
  config.period = toDuration(integerField(src, "period", 0), *unit);
  return config;
}

RotationConfig rotationFromJson(const nlohmann::json &loggerEntry) {
  RotationConfig config;
  if (!loggerEntry.contains("rotation")) return config;

  const auto &rotation = loggerEntry["rotation"];
  if (!rotation.is_object()) {
    throw std::runtime_error("'rotation' must be an object");
  }
  const std::string typeName = rotation.value("type", std::string("none"));
  const auto type = rotationTypeFromString(typeName);
  if (!type) {
    throw std::runtime_error("Unknown rotation type: " + typeName);
  }

  config.type = *type;
  config.enabled = *type != RotationType::NONE;
  config.maxFileSizeBytes = static_cast<std::size_t>(
      std::max<std::int64_t>(0, integerField(rotation, "maxSizeBytes", 0)));
  config.rotationInterval = std::chrono::hours(
      std::max<std::int64_t>(0, integerField(rotation, "intervalHours", 0)));
  config.maxBackups = static_cast<std::size_t>(
      std::max<std::int64_t>(1, integerField(rotation, "maxBackups", 3)));
  return config;
}

EngineConfig EngineConfig::fromJson(const nlohmann::json &src) {
  EngineConfig config;

  if (!src.contains("monitorFolders") || !src["monitorFolders"].is_array()) {
    throw std::runtime_error("Config missing required 'monitorFolders' array");
  }
  for (const auto &folder : src["monitorFolders"]) {
    if (!folder.is_string()) {
      throw std::runtime_error("monitorFolders entries must be strings");
    }
    config.monitorFolders.emplace_back(folder.get<std::string>());
  }

  if (src.contains("seitonRules")) {
    if (!src["seitonRules"].is_array()) {
      throw std::runtime_error("'seitonRules' must be an array");
    }
    for (const auto &rule : src["seitonRules"]) {
      config.seitonRules.push_back(SeitonRule::fromJson(rule));
    }
  }

  // ============= Seiri =============
  const auto &seiri = section(src, "seiriConfig");
  config.seiri.schedule = ScheduleConfig::fromJson(seiri);
  const auto &ageRule =
      section(section(seiri, "rules"), "moveFilesNotAccessedForDays");
  config.seiri.rule.enabled = ageRule.value("enabled", false);
  config.seiri.rule.days = integerField(ageRule, "days", 0);
  config.seiri.rule.destination = pathField(ageRule, "destination");

  // ============= Seiso =============
  const auto &seiso = section(src, "seisoConfig");
  config.seiso.schedule = ScheduleConfig::fromJson(seiso);
  const auto &cleanRule =
      section(section(seiso, "rules"), "cleanTemporaryFolders");
  config.seiso.rule.enabled = cleanRule.value("enabled", false);
  if (cleanRule.contains("folders") && cleanRule["folders"].is_array()) {
    for (const auto &folder : cleanRule["folders"]) {
      if (folder.is_string()) {
        config.seiso.rule.folders.emplace_back(folder.get<std::string>());
      }
    }
  }

  // ============= Поиск дубликатов =============
  const auto &dup = section(src, "duplicateDetectionConfig");
  config.duplicateDetection.schedule = ScheduleConfig::fromJson(dup);
  const auto &dupRules = section(dup, "rules");
  auto &rules = config.duplicateDetection.rules;
  rules.minFileSizeBytes = static_cast<std::uintmax_t>(
      std::max<std::int64_t>(0, integerField(dupRules, "minFileSizeBytes", 0)));
  rules.maxFileSizeBytes = static_cast<std::uintmax_t>(
      std::max<std::int64_t>(0, integerField(dupRules, "maxFileSizeBytes", 0)));
  rules.autoRemove = dupRules.value("autoRemove", false);
  rules.duplicatesDestination = pathField(dupRules, "duplicatesDestination");
  if (dupRules.contains("keepStrategy") && dupRules["keepStrategy"].is_string()) {
    const std::string name = dupRules["keepStrategy"].get<std::string>();
    auto keep = parseKeepStrategy(name);
    if (!keep) {
      throw std::runtime_error("Unknown keepStrategy: " + name);
    }
    rules.keepStrategy = *keep;
  }

  return config;
}

}  // namespace kirei
