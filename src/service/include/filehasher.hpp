#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace kirei {

/// Вычисление прервано запросом остановки
class HashCancelled : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/**
 * @class FileHasher
 * @brief SHA-256 содержимого файла (OpenSSL EVP) в виде hex-строки
 *
 * @details
 * Файлы не больше kSmallFileThreshold читаются целиком, более крупные
 * читаются блоками по kChunkSize, так что расход памяти не зависит от
 * размера файла. Между блоками проверяется флаг отмены.
 */
class FileHasher {
 public:
  static constexpr std::size_t kChunkSize = 8192;
  static constexpr std::uintmax_t kSmallFileThreshold = 8192;

  explicit FileHasher(const std::atomic<bool> *cancelled = nullptr)
      : cancelled_(cancelled) {}

  /**
   * @return 64 шестнадцатеричных символа в нижнем регистре
   * @throw std::runtime_error Файл не открывается, ошибка чтения или OpenSSL
   * @throw HashCancelled Флаг отмены установлен во время чтения
   */
  std::string sha256(const std::filesystem::path &file) const;

 private:
  const std::atomic<bool> *cancelled_;
};

}  // namespace kirei
