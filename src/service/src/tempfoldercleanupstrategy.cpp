#include "../include/tempfoldercleanupstrategy.hpp"

#include <algorithm>
#include <functional>
#include <system_error>

#include "../include/enginemetrics.hpp"
#include "kirei/MetricsCollector.hpp"
#include "kirei/compositelogger.hpp"

namespace fs = std::filesystem;

namespace kirei {

TempFolderCleanupStrategy::TempFolderCleanupStrategy(SeisoRule rule)
    : rule_(std::move(rule)) {}

void TempFolderCleanupStrategy::execute(const ScanContext &context) {
  auto &logger = CompositeLogger::instance();

  if (!rule_.enabled) {
    logger.info("Seiso: cleanTemporaryFolders rule is disabled");
    return;
  }

  std::size_t removed = 0;
  for (const auto &folder : rule_.folders) {
    if (context.isCancelled()) break;

    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
      logger.warning("Seiso: temporary folder not found, skipping: " +
                     folder.string());
      continue;
    }
    removed += cleanFolder(folder, context);
  }

  logger.info("Seiso: finished, " + std::to_string(removed) +
              " entries removed");
}

std::size_t TempFolderCleanupStrategy::cleanFolder(const fs::path &root,
                                                   const ScanContext &context) {
  auto &logger = CompositeLogger::instance();
  std::vector<fs::path> entries;
  std::error_code ec;

  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    logger.warning("Seiso: cannot walk " + root.string() + ": " + ec.message());
    return 0;
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      logger.warning("Seiso: walk error under " + root.string() + ": " +
                     ec.message());
      break;
    }
    entries.push_back(it->path());
  }

  // Вложенные записи идут раньше своих родителей
  std::sort(entries.begin(), entries.end(), std::greater<fs::path>());

  std::size_t removed = 0;
  for (const auto &entry : entries) {
    if (context.isCancelled()) {
      logger.warning("Seiso: cancelled while cleaning " + root.string());
      break;
    }
    if (entry == root) continue;
    if (removeEntry(entry)) ++removed;
  }

  logger.info("Seiso: cleaned " + root.string() + " (" +
              std::to_string(removed) + " of " +
              std::to_string(entries.size()) + " entries)");
  return removed;
}

bool TempFolderCleanupStrategy::removeEntry(const fs::path &entry) {
  auto &collector = MetricsCollector::instance();
  std::error_code ec;
  if (fs::remove(entry, ec)) {
    collector.incrementCounter(metrics::kFilesDeleted);
    CompositeLogger::instance().debug("Seiso: removed " + entry.string());
    return true;
  }
  if (ec) {
    collector.incrementCounter(metrics::kDeleteFailures);
    CompositeLogger::instance().warning("Seiso: cannot remove " +
                                        entry.string() + ": " + ec.message());
  }
  return false;
}

}  // namespace kirei
