#include "../include/filetransferresolver.hpp"

#include <string>
#include <system_error>

#include "../include/enginemetrics.hpp"
#include "kirei/MetricsCollector.hpp"
#include "kirei/compositelogger.hpp"

namespace fs = std::filesystem;

namespace kirei {

namespace {

bool occupied(const fs::path &path) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path, ec));
}

void countFailure() {
  MetricsCollector::instance().incrementCounter(metrics::kMoveFailures);
}

}  // namespace

std::optional<fs::path> FileTransferResolver::uniqueTarget(
    const fs::path &target, int maxAttempts) {
  if (!occupied(target)) return target;

  const std::string name = target.filename().string();
  std::string base = name;
  std::string extension;
  const auto dot = name.rfind('.');
  if (dot != std::string::npos && dot > 0) {
    base = name.substr(0, dot);
    extension = name.substr(dot);
  }

  for (int counter = 1; counter <= maxAttempts; ++counter) {
    fs::path candidate = target.parent_path() /
                         (base + "_" + std::to_string(counter) + extension);
    if (!occupied(candidate)) return candidate;
  }
  return std::nullopt;
}

std::optional<fs::path> FileTransferResolver::move(
    const fs::path &source, const fs::path &destinationFolder) const {
  auto &logger = CompositeLogger::instance();
  std::error_code ec;

  if (!fs::is_regular_file(fs::symlink_status(source, ec))) {
    logger.warning("Skipping move, source is no longer a regular file: " +
                   source.string());
    countFailure();
    return std::nullopt;
  }

  if (!fs::is_directory(destinationFolder, ec)) {
    fs::create_directories(destinationFolder, ec);
    if (ec) {
      logger.error("Cannot create destination folder " +
                   destinationFolder.string() + ": " + ec.message());
      countFailure();
      return std::nullopt;
    }
    logger.info("Created directory: " + destinationFolder.string());
  }

  auto target = uniqueTarget(destinationFolder / source.filename());
  if (!target) {
    logger.error("No free name for " + source.filename().string() + " in " +
                 destinationFolder.string() + " after " +
                 std::to_string(kMaxAttempts) + " attempts");
    countFailure();
    return std::nullopt;
  }

  if (!relocate(source, *target)) {
    countFailure();
    return std::nullopt;
  }

  MetricsCollector::instance().incrementCounter(metrics::kFilesMoved);
  logger.info("Moved " + source.string() + " -> " + target->string());
  return target;
}

bool FileTransferResolver::relocate(const fs::path &from, const fs::path &to) {
  auto &logger = CompositeLogger::instance();
  std::error_code ec;

  fs::rename(from, to, ec);
  if (!ec) return true;

  if (ec != std::errc::cross_device_link) {
    logger.error("Failed to move " + from.string() + " -> " + to.string() +
                 ": " + ec.message());
    return false;
  }

  // Разные файловые системы: копия, затем удаление исходного файла
  fs::copy_file(from, to, fs::copy_options::none, ec);
  if (ec) {
    logger.error("Failed to copy " + from.string() + " -> " + to.string() +
                 ": " + ec.message());
    std::error_code cleanup;
    fs::remove(to, cleanup);
    return false;
  }

  fs::remove(from, ec);
  if (ec) {
    logger.error("Copied " + from.string() + " but could not remove it: " +
                 ec.message() + "; discarding the copy");
    std::error_code cleanup;
    fs::remove(to, cleanup);
    return false;
  }
  return true;
}

}  // namespace kirei
