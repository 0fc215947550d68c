#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace kirei {

enum class RotationType { NONE, SIZE, TIME };

/**
 * @struct RotationConfig
 * @brief Параметры ротации файлового журнала.
 *
 * @details
 * SIZE: журнал уходит в архив, когда очередная запись превысила бы
 * maxFileSizeBytes. Архивы нумеруются `<file>.1` (самый новый) ...
 * `<file>.<maxBackups>`, более старые удаляются.
 * TIME: журнал уходит в архив `<file>.<YYYYmmdd-HHMMSS>` раз в
 * rotationInterval, отсчёт от открытия файла или предыдущей ротации.
 */
struct RotationConfig {
  bool enabled = false;
  RotationType type = RotationType::NONE;
  std::size_t maxFileSizeBytes = 0;
  std::chrono::seconds rotationInterval{0};
  std::size_t maxBackups = 3;
};

/// "size" / "time" / "none" без учёта регистра
std::optional<RotationType> rotationTypeFromString(const std::string& name);

class IRotatableLogger {
 public:
  virtual void setRotationConfig(const RotationConfig& config) = 0;
  virtual RotationConfig getRotationConfig() const = 0;
  virtual ~IRotatableLogger() = default;
};

}  // namespace kirei
