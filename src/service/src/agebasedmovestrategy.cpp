#include "../include/agebasedmovestrategy.hpp"

#include <chrono>
#include <system_error>

#include "../include/pathutils.hpp"
#include "kirei/compositelogger.hpp"

namespace fs = std::filesystem;

namespace kirei {

AgeBasedMoveStrategy::AgeBasedMoveStrategy(SeiriRule rule,
                                           FileTransferResolver resolver)
    : rule_(std::move(rule)), resolver_(resolver) {}

bool AgeBasedMoveStrategy::isStale(fs::file_time_type lastModified,
                                   fs::file_time_type now) const {
  return now - lastModified > std::chrono::hours(24 * rule_.days);
}

std::vector<fs::path> AgeBasedMoveStrategy::collectFiles(
    const fs::path &root, const ScanContext &context) const {
  auto &logger = CompositeLogger::instance();
  std::vector<fs::path> files;
  std::error_code ec;

  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    logger.warning("Seiri: cannot walk " + root.string() + ": " + ec.message());
    return files;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      logger.warning("Seiri: walk error under " + root.string() + ": " +
                     ec.message());
      break;
    }
    if (context.isCancelled()) break;

    const auto &path = it->path();
    if (isWithin(path, rule_.destination)) {
      if (it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    if (it->is_regular_file(ec) && !it->is_symlink(ec)) {
      files.push_back(path);
    }
  }
  return files;
}

void AgeBasedMoveStrategy::execute(const ScanContext &context) {
  auto &logger = CompositeLogger::instance();

  if (!rule_.enabled) {
    logger.info("Seiri: moveFilesNotAccessedForDays rule is disabled");
    return;
  }

  logger.info("Seiri: moving files older than " + std::to_string(rule_.days) +
              " days to " + rule_.destination.string());

  std::size_t moved = 0;
  for (const auto &folder : context.monitoredFolders) {
    for (const auto &file : collectFiles(folder, context)) {
      if (context.isCancelled()) {
        logger.warning("Seiri: cancelled, " + std::to_string(moved) +
                       " files moved");
        return;
      }

      std::error_code ec;
      const auto lastModified = fs::last_write_time(file, ec);
      if (ec) {
        logger.warning("Seiri: cannot read modification time of " +
                       file.string() + ": " + ec.message());
        continue;
      }
      if (!isStale(lastModified, context.now)) continue;

      const auto extension = extensionOf(file);
      const auto destination =
          extension ? rule_.destination / toUpper(*extension)
                    : rule_.destination;
      if (resolver_.move(file, destination)) ++moved;
    }
  }

  logger.info("Seiri: finished, " + std::to_string(moved) + " files moved");
}

}  // namespace kirei
