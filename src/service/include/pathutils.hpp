#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace kirei {

/**
 * @brief Расширение файла: подстрока имени после последней точки в нижнем
 * регистре
 * @return std::nullopt, если точки нет или после неё ничего нет
 */
std::optional<std::string> extensionOf(const std::filesystem::path &file);

/// "PDF", ".pdf", " .Pdf" -> "pdf"
std::string normalizeExtension(const std::string &extension);

std::string toUpper(std::string value);

/// Истина, если path совпадает с root или лежит внутри него
bool isWithin(const std::filesystem::path &path,
              const std::filesystem::path &root);

}  // namespace kirei
