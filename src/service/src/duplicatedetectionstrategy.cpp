#include "../include/duplicatedetectionstrategy.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <system_error>

#include "../include/enginemetrics.hpp"
#include "../include/filehasher.hpp"
#include "../include/pathutils.hpp"
#include "kirei/MetricsCollector.hpp"
#include "kirei/compositelogger.hpp"

namespace fs = std::filesystem;

namespace kirei {

namespace {

constexpr double kBytesPerMiB = 1024.0 * 1024.0;

std::string megabytes(std::uintmax_t bytes) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2)
     << static_cast<double>(bytes) / kBytesPerMiB << " MB";
  return ss.str();
}

}  // namespace

std::uintmax_t DuplicateGroup::wastedBytes() const {
  if (files.size() < 2) return 0;
  return files.front().size * (files.size() - 1);
}

std::size_t DuplicateReport::duplicateFiles() const {
  std::size_t total = 0;
  for (const auto &group : groups) total += group.files.size();
  return total;
}

double DuplicateReport::duplicationPercent() const {
  if (scannedBytes == 0) return 0.0;
  return static_cast<double>(totalWasted) * 100.0 /
         static_cast<double>(scannedBytes);
}

DuplicateDetectionStrategy::DuplicateDetectionStrategy(
    DuplicateRules rules, FileTransferResolver resolver)
    : rules_(std::move(rules)), resolver_(resolver) {}

bool DuplicateDetectionStrategy::isSystemArtifact(const fs::path &file) {
  std::string name = file.filename().string();
  if (name.empty() || name.front() == '.') return true;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return name == "thumbs.db" || name == "desktop.ini";
}

bool DuplicateDetectionStrategy::withinSizeBounds(std::uintmax_t size) const {
  if (rules_.minFileSizeBytes > 0 && size < rules_.minFileSizeBytes) {
    return false;
  }
  if (rules_.maxFileSizeBytes > 0 && size > rules_.maxFileSizeBytes) {
    return false;
  }
  return true;
}

std::vector<fs::path> DuplicateDetectionStrategy::collectCandidates(
    const fs::path &root, const ScanContext &context) const {
  auto &logger = CompositeLogger::instance();
  std::vector<fs::path> files;
  std::error_code ec;

  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    logger.error("DuplicateDetection: cannot walk " + root.string() + ": " +
                 ec.message());
    return files;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      logger.warning("DuplicateDetection: walk error under " + root.string() +
                     ": " + ec.message());
      break;
    }
    if (context.isCancelled()) break;

    const auto &path = it->path();
    if (isWithin(path, rules_.duplicatesDestination)) {
      if (it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    // Ссылки и специальные файлы не сравниваются
    if (it->is_symlink(ec) || !it->is_regular_file(ec)) continue;
    if (isSystemArtifact(path)) continue;
    files.push_back(path);
  }

  std::sort(files.begin(), files.end());
  return files;
}

DuplicateReport DuplicateDetectionStrategy::scan(
    const ScanContext &context) const {
  auto &logger = CompositeLogger::instance();
  const auto started = std::chrono::steady_clock::now();
  const FileHasher hasher(context.cancelled);

  DuplicateReport report;
  std::map<std::string, std::vector<FileRecord>> byDigest;
  // Вложенные или повторённые monitorFolders дают один и тот же файл дважды
  std::set<fs::path> recorded;

  for (const auto &folder : context.monitoredFolders) {
    if (report.cancelled) break;

    for (const auto &file : collectCandidates(folder, context)) {
      if (context.isCancelled()) {
        report.cancelled = true;
        break;
      }

      std::error_code ec;
      auto identity = fs::weakly_canonical(file, ec);
      if (ec) identity = fs::absolute(file, ec).lexically_normal();
      if (!recorded.insert(identity).second) continue;

      const auto size = fs::file_size(file, ec);
      if (ec) {
        logger.debug("DuplicateDetection: cannot stat " + file.string() +
                     ": " + ec.message());
        continue;
      }
      if (!withinSizeBounds(size)) continue;

      const auto lastModified = fs::last_write_time(file, ec);
      if (ec) {
        logger.debug("DuplicateDetection: cannot stat " + file.string() +
                     ": " + ec.message());
        continue;
      }

      FileRecord record{file, size, lastModified, {}};
      try {
        record.digest = hasher.sha256(file);
      } catch (const HashCancelled &) {
        report.cancelled = true;
        break;
      } catch (const std::exception &e) {
        logger.debug("DuplicateDetection: skipping " + file.string() + ": " +
                     e.what());
        continue;
      }

      ++report.scannedFiles;
      report.scannedBytes += size;
      const std::string digest = record.digest;
      byDigest[digest].push_back(std::move(record));
    }
  }

  for (auto &[digest, files] : byDigest) {
    if (files.size() < 2) continue;
    DuplicateGroup group{digest, std::move(files)};
    report.totalWasted += group.wastedBytes();
    report.groups.push_back(std::move(group));
  }

  report.scanTime = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return report;
}

const FileRecord &DuplicateDetectionStrategy::selectSurvivor(
    const DuplicateGroup &group, KeepStrategy strategy) {
  const auto &files = group.files;
  auto survivor = files.begin();

  switch (strategy) {
    case KeepStrategy::Newest:
      for (auto it = files.begin(); it != files.end(); ++it) {
        if (it->lastModified > survivor->lastModified) survivor = it;
      }
      break;
    case KeepStrategy::Oldest:
      for (auto it = files.begin(); it != files.end(); ++it) {
        if (it->lastModified < survivor->lastModified) survivor = it;
      }
      break;
    case KeepStrategy::Manual:
      break;
  }
  return *survivor;
}

void DuplicateDetectionStrategy::remediate(const DuplicateGroup &group,
                                           const ScanContext &context) const {
  auto &logger = CompositeLogger::instance();
  auto &collector = MetricsCollector::instance();
  const FileRecord &survivor = selectSurvivor(group, rules_.keepStrategy);

  for (const auto &record : group.files) {
    if (&record == &survivor) continue;
    if (context.isCancelled()) return;

    if (!rules_.duplicatesDestination.empty()) {
      resolver_.move(record.path, rules_.duplicatesDestination);
      continue;
    }

    std::error_code ec;
    if (fs::remove(record.path, ec)) {
      collector.incrementCounter(metrics::kFilesDeleted);
      logger.info("Duplicate removed: " + record.path.string() + " (kept " +
                  survivor.path.string() + ")");
    } else {
      collector.incrementCounter(metrics::kDeleteFailures);
      logger.error("Duplicate removal failed: " + record.path.string() +
                   (ec ? ": " + ec.message() : std::string(": not found")));
    }
  }
}

void DuplicateDetectionStrategy::logReport(
    const DuplicateReport &report) const {
  auto &logger = CompositeLogger::instance();

  for (const auto &group : report.groups) {
    logger.warning("Duplicates found (" + std::to_string(group.files.size()) +
                   " files, " + megabytes(group.wastedBytes()) + " wasted)");
    for (const auto &record : group.files) {
      logger.warning("  - " + record.path.string());
    }
  }

  std::ostringstream percent;
  percent << std::fixed << std::setprecision(1) << report.duplicationPercent();

  logger.info("=== Duplicate report ===");
  logger.info("Files scanned: " + std::to_string(report.scannedFiles));
  logger.info("Bytes scanned: " + megabytes(report.scannedBytes));
  logger.info("Duplicate groups: " + std::to_string(report.groups.size()));
  logger.info("Duplicate files: " + std::to_string(report.duplicateFiles()));
  logger.info("Wasted space: " + megabytes(report.totalWasted));
  logger.info("Scan time: " + std::to_string(report.scanTime.count()) + "ms");
  logger.info("Duplication: " + percent.str() + "%");
}

void DuplicateDetectionStrategy::execute(const ScanContext &context) {
  auto &logger = CompositeLogger::instance();
  logger.info("DuplicateDetection: scanning " +
              std::to_string(context.monitoredFolders.size()) + " folders");

  const DuplicateReport report = scan(context);
  if (report.cancelled) {
    logger.warning("DuplicateDetection: scan cancelled, no action taken");
    return;
  }

  MetricsCollector::instance().incrementCounter(
      metrics::kDuplicateGroups, static_cast<double>(report.groups.size()));
  logReport(report);

  if (!rules_.autoRemove) return;
  for (const auto &group : report.groups) {
    if (context.isCancelled()) break;
    remediate(group, context);
  }
}

}  // namespace kirei
