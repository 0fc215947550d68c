#include "../include/pathutils.hpp"

#include <algorithm>
#include <cctype>

namespace kirei {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string trim(const std::string &value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

}  // namespace

std::optional<std::string> extensionOf(const std::filesystem::path &file) {
  const std::string name = file.filename().string();
  const auto dot = name.rfind('.');
  if (dot == std::string::npos || dot + 1 >= name.size()) {
    return std::nullopt;
  }
  return toLower(name.substr(dot + 1));
}

std::string normalizeExtension(const std::string &extension) {
  std::string value = trim(extension);
  if (!value.empty() && value.front() == '.') value.erase(0, 1);
  return toLower(value);
}

std::string toUpper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return value;
}

bool isWithin(const std::filesystem::path &path,
              const std::filesystem::path &root) {
  if (root.empty()) return false;
  const auto normPath = path.lexically_normal();
  auto normRoot = root.lexically_normal();
  if (!normRoot.has_filename()) normRoot = normRoot.parent_path();

  auto rootIt = normRoot.begin();
  auto pathIt = normPath.begin();
  for (; rootIt != normRoot.end(); ++rootIt, ++pathIt) {
    if (pathIt == normPath.end() || *pathIt != *rootIt) return false;
  }
  return true;
}

}  // namespace kirei
