#include "../include/configloader.hpp"

#include <fstream>
#include <sstream>

namespace kirei {

namespace {

[[noreturn]] void rethrowParseError(const nlohmann::json::parse_error &e) {
  std::stringstream ss;
  ss << "ConfigLoader: JSON parse error: " << e.what() << " at byte "
     << e.byte;
  throw std::runtime_error(ss.str());
}

}  // namespace

nlohmann::json ConfigLoader::loadFromFile(const std::string &filename) {
  if (filename.empty()) {
    throw std::runtime_error("ConfigLoader: empty configuration file name");
  }
  auto config = readFileContents(filename);
  lastLoadedFile = filename;
  return config;
}

nlohmann::json ConfigLoader::loadFromString(const std::string &content) const {
  try {
    return nlohmann::json::parse(content);
  } catch (const nlohmann::json::parse_error &e) {
    rethrowParseError(e);
  }
}

std::string ConfigLoader::getLastLoadedFile() const { return lastLoadedFile; }

bool ConfigLoader::hasLoadedFile() const { return !lastLoadedFile.empty(); }

nlohmann::json ConfigLoader::readFileContents(
    const std::string &filename) const {
  std::ifstream file(filename);

  if (!file.is_open()) {
    throw std::runtime_error("ConfigLoader: Failed to open file " + filename);
  }

  try {
    nlohmann::json config;
    file >> config;
    return config;
  } catch (const nlohmann::json::parse_error &e) {
    rethrowParseError(e);
  }
}

}  // namespace kirei
