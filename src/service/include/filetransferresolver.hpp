/**
 * @file filetransferresolver.hpp
 * @brief Перемещение файла в каталог назначения без перезаписи
 *
 * @details
 * Каталог назначения создаётся вместе с промежуточными каталогами. Если в
 * нём уже есть файл с таким именем, подбирается свободное имя
 * `имя_N.расширение` (N = 1..999). При любой ошибке исходный файл остаётся
 * на месте.
 */
#pragma once

#include <filesystem>
#include <optional>

namespace kirei {

class FileTransferResolver {
 public:
  static constexpr int kMaxAttempts = 999;

  /**
   * @brief Переместить source в destinationFolder
   * @return Итоговый путь файла или std::nullopt, если файл не перемещён
   *
   * @code
   // /archive/PDF уже содержит report.pdf
   auto target = resolver.move("/in/report.pdf", "/archive/PDF");
   // *target == "/archive/PDF/report_1.pdf"
   @endcode
   */
  std::optional<std::filesystem::path> move(
      const std::filesystem::path &source,
      const std::filesystem::path &destinationFolder) const;

  /**
   * @brief Свободное имя для target
   * @return target, если он свободен; иначе первый свободный вариант
   * `имя_N.расширение`; std::nullopt, если все maxAttempts вариантов заняты
   *
   * Точка в начале имени (".profile") не считается началом расширения.
   */
  static std::optional<std::filesystem::path> uniqueTarget(
      const std::filesystem::path &target, int maxAttempts = kMaxAttempts);

 private:
  static bool relocate(const std::filesystem::path &from,
                       const std::filesystem::path &to);
};

}  // namespace kirei
