/**
 * @file duplicatedetectionstrategy.hpp
 * @brief Поиск файлов с одинаковым содержимым по SHA-256
 *
 * @details
 * Каждый запуск строит карту "хеш -> файлы" заново, как локальное состояние
 * одного сканирования; между запусками ничего не сохраняется. Группа из
 * одного файла дубликатом не считается. При включённом autoRemove в каждой
 * группе остаётся один файл (по KeepStrategy), остальные удаляются или
 * переносятся в каталог карантина.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "engineconfig.hpp"
#include "filetransferresolver.hpp"
#include "rulestrategy.hpp"

namespace kirei {

/// Снимок файла на момент сканирования
struct FileRecord {
  std::filesystem::path path;
  std::uintmax_t size = 0;
  std::filesystem::file_time_type lastModified;
  std::string digest;
};

struct DuplicateGroup {
  std::string digest;
  /// В порядке обнаружения
  std::vector<FileRecord> files;

  /// size * (count - 1)
  std::uintmax_t wastedBytes() const;
};

struct DuplicateReport {
  std::uint64_t scannedFiles = 0;
  std::uintmax_t scannedBytes = 0;
  /// Только группы из двух и более файлов, упорядочены по хешу
  std::vector<DuplicateGroup> groups;
  std::uintmax_t totalWasted = 0;
  std::chrono::milliseconds scanTime{0};
  bool cancelled = false;

  std::size_t duplicateFiles() const;
  /// wasted / scanned * 100; 0 для пустого сканирования
  double duplicationPercent() const;
};

class DuplicateDetectionStrategy : public ScheduledTaskStrategy {
 public:
  explicit DuplicateDetectionStrategy(DuplicateRules rules,
                                      FileTransferResolver resolver = {});

  /**
   * @brief Сканирование без изменения файловой системы
   *
   * Каталоги обходятся рекурсивно, внутри каталога файлы берутся в
   * лексическом порядке путей, поэтому повторное сканирование неизменного
   * дерева даёт тот же отчёт.
   */
  DuplicateReport scan(const ScanContext &context) const;

  /// Сканирование, отчёт в журнал и, при autoRemove, устранение дубликатов
  void execute(const ScanContext &context) override;

  std::string name() const override { return "DuplicateDetection"; }

  /**
   * @brief Файл, который останется в группе
   *
   * NEWEST и OLDEST выбирают по времени изменения, при равенстве первый
   * обнаруженный; MANUAL всегда оставляет первый обнаруженный.
   */
  static const FileRecord &selectSurvivor(const DuplicateGroup &group,
                                          KeepStrategy strategy);

  /// Скрытые файлы и служебные файлы ОС (.DS_Store, Thumbs.db, desktop.ini)
  static bool isSystemArtifact(const std::filesystem::path &file);

 private:
  bool withinSizeBounds(std::uintmax_t size) const;
  std::vector<std::filesystem::path> collectCandidates(
      const std::filesystem::path &root, const ScanContext &context) const;
  void logReport(const DuplicateReport &report) const;
  void remediate(const DuplicateGroup &group, const ScanContext &context) const;

  DuplicateRules rules_;
  FileTransferResolver resolver_;
};

}  // namespace kirei
