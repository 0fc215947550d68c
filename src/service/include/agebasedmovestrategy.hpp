#pragma once

#include "engineconfig.hpp"
#include "filetransferresolver.hpp"
#include "rulestrategy.hpp"

namespace kirei {

/**
 * @class AgeBasedMoveStrategy
 * @brief Seiri: перенос файлов, не изменявшихся дольше заданного числа суток
 *
 * @details
 * Файл переносится, если `now - lastModified` строго больше порога. Файлы с
 * расширением попадают в `<destination>/<РАСШИРЕНИЕ>/`, без расширения в
 * сам `<destination>`. Файлы, уже лежащие внутри destination, не
 * трогаются. Список файлов снимается до начала перемещений.
 */
class AgeBasedMoveStrategy : public ScheduledTaskStrategy {
 public:
  explicit AgeBasedMoveStrategy(SeiriRule rule,
                                FileTransferResolver resolver = {});

  void execute(const ScanContext &context) override;
  std::string name() const override { return "Seiri"; }

  bool isStale(std::filesystem::file_time_type lastModified,
               std::filesystem::file_time_type now) const;

 private:
  std::vector<std::filesystem::path> collectFiles(
      const std::filesystem::path &root, const ScanContext &context) const;

  SeiriRule rule_;
  FileTransferResolver resolver_;
};

}  // namespace kirei
