/**
 * @file directorywatcher.hpp
 * @brief Наблюдение за каталогами и применение правил Seiton к новым файлам
 *
 * @details
 * DirectoryWatcher регистрирует inotify-наблюдение на каждом каталоге из
 * списка (без вложенных каталогов) и реагирует на появление файлов
 * (IN_CREATE, IN_MOVED_TO). После события выдерживается пауза settleDelay,
 * чтобы писатель успел закрыть файл, затем файл проверяется и передаётся
 * правилам по порядку: срабатывает первое подходящее правило.
 *
 * start() блокирует вызывающий поток до stop() или фатальной ошибки
 * inotify. stop() можно вызывать из любого потока, в том числе до start().
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "rulestrategy.hpp"

namespace kirei {

class DirectoryWatcher {
 public:
  using RuleList = std::vector<std::shared_ptr<RuleStrategy>>;
  /// Дескриптор наблюдения inotify -> каталог
  using WatchTable = std::unordered_map<int, std::filesystem::path>;

  /// Разобранная пачка событий inotify
  struct EventBatch {
    std::vector<std::filesystem::path> files;  ///< новые файлы по порядку
    std::vector<int> movedWatches;  ///< наблюдения, которые надо снять (IN_MOVE_SELF)
    std::size_t overflows = 0;
  };

  static constexpr std::chrono::milliseconds kDefaultSettleDelay{500};

  explicit DirectoryWatcher(
      std::chrono::milliseconds settleDelay = kDefaultSettleDelay);
  ~DirectoryWatcher();

  DirectoryWatcher(const DirectoryWatcher &) = delete;
  DirectoryWatcher &operator=(const DirectoryWatcher &) = delete;

  /**
   * @brief Запустить цикл наблюдения в текущем потоке
   *
   * Каталоги, которые не удалось зарегистрировать, пропускаются с
   * предупреждением. Если не зарегистрирован ни один каталог, метод сразу
   * возвращает управление.
   *
   * @throw std::runtime_error Если не удалось создать дескриптор inotify
   */
  void start(const std::vector<std::filesystem::path> &folders,
             const RuleList &rules);

  /// Запросить завершение цикла; идемпотентен
  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  /**
   * @brief Передать файл правилам по порядку до первого сработавшего
   * @return Имя сработавшего правила или std::nullopt
   *
   * Файл без расширения правилам не передаётся. Исключение из правила
   * записывается в журнал, и дальнейшие правила для файла не вызываются.
   */
  static std::optional<std::string> dispatch(const std::filesystem::path &file,
                                             const RuleList &rules);

  /**
   * @brief Разобрать буфер, прочитанный из дескриптора inotify
   * @param data   Начало буфера (последовательность struct inotify_event)
   * @param length Число прочитанных байт
   * @param watches Таблица наблюдений; IN_IGNORED удаляет из неё запись
   *
   * Переполнение очереди ядра (IN_Q_OVERFLOW) записывается в журнал и
   * счётчик watch_overflows. События о каталогах и события с неизвестным
   * дескриптором пропускаются.
   */
  static EventBatch decodeEvents(const char *data, std::size_t length,
                                 WatchTable &watches);

 private:
  struct PendingFile {
    std::filesystem::path path;
    std::chrono::steady_clock::time_point readyAt;
  };

  /// Ждать до deadline; false, если пришёл запрос остановки
  bool settle(std::chrono::steady_clock::time_point deadline);
  bool stopRequested() const;

  std::chrono::milliseconds settleDelay_;
  std::atomic<bool> running_{false};

  mutable std::mutex mutex_;
  std::condition_variable stopCv_;
  bool stopRequested_ = false;
};

}  // namespace kirei
