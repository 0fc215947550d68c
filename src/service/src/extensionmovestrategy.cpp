#include "../include/extensionmovestrategy.hpp"

#include "../include/pathutils.hpp"
#include "kirei/compositelogger.hpp"

namespace kirei {

ExtensionMoveStrategy::ExtensionMoveStrategy(SeitonRule rule,
                                             FileTransferResolver resolver)
    : rule_(std::move(rule)), resolver_(resolver) {}

bool ExtensionMoveStrategy::apply(const std::filesystem::path &file) {
  const auto extension = extensionOf(file);
  if (!extension || !rule_.matches(*extension)) return false;

  const auto destination = rule_.destination / toUpper(*extension);
  CompositeLogger::instance().debug("Seiton rule '" + rule_.name +
                                    "' matched " + file.string());
  resolver_.move(file, destination);
  return true;
}

std::string ExtensionMoveStrategy::name() const {
  return "Seiton[" + rule_.name + "]";
}

}  // namespace kirei
