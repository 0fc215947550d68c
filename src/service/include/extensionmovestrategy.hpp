#pragma once

#include "engineconfig.hpp"
#include "filetransferresolver.hpp"
#include "rulestrategy.hpp"

namespace kirei {

/**
 * @class ExtensionMoveStrategy
 * @brief Seiton: перенос нового файла в `<destination>/<РАСШИРЕНИЕ>/`
 *
 * Один экземпляр на одно правило из seitonRules.
 */
class ExtensionMoveStrategy : public RuleStrategy {
 public:
  explicit ExtensionMoveStrategy(SeitonRule rule,
                                 FileTransferResolver resolver = {});

  bool apply(const std::filesystem::path &file) override;
  std::string name() const override;

  const SeitonRule &rule() const { return rule_; }

 private:
  SeitonRule rule_;
  FileTransferResolver resolver_;
};

}  // namespace kirei
