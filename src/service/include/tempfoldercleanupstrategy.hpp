#pragma once

#include "engineconfig.hpp"
#include "rulestrategy.hpp"

namespace kirei {

/**
 * @class TempFolderCleanupStrategy
 * @brief Seiso: удаление всего содержимого временных каталогов
 *
 * @details
 * Записи удаляются в обратном лексическом порядке путей, то есть вложенные
 * записи раньше родительских каталогов. Сам настроенный каталог не
 * удаляется. Неудачное удаление записывается в журнал и не прерывает
 * очистку.
 */
class TempFolderCleanupStrategy : public ScheduledTaskStrategy {
 public:
  explicit TempFolderCleanupStrategy(SeisoRule rule);

  void execute(const ScanContext &context) override;
  std::string name() const override { return "Seiso"; }

  /// @return Количество удалённых записей
  std::size_t cleanFolder(const std::filesystem::path &root,
                          const ScanContext &context);

 protected:
  /// Удаляет файл или пустой каталог; не рекурсивно
  virtual bool removeEntry(const std::filesystem::path &entry);

 private:
  SeisoRule rule_;
};

}  // namespace kirei
