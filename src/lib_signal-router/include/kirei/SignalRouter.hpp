/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @details Сигналы принимаются через signalfd и epoll в отдельном потоке,
 * поэтому обработчики выполняются в обычном контексте, а не в контексте
 * асинхронного обработчика сигнала. Для одного сигнала можно
 * зарегистрировать несколько обработчиков.
 */
#pragma once

#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kirei {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов (Singleton)
 *
 * @warning
 * - Только для Linux
 * - SIGKILL и SIGSTOP не поддерживаются
 * - Сигнал должен быть заблокирован во всех потоках процесса, иначе ядро
 *   доставит его обычным способом. Регистрируйте обработчики до создания
 *   рабочих потоков (см. SignalMaskGuard).
 */
class SignalRouter {
 public:
  using Handler = std::function<void(int)>;

  static SignalRouter& instance() {
    static SignalRouter router;
    return router;
  }

  /**
   * @brief Зарегистрировать обработчик для сигнала
   * @throw std::invalid_argument При неверном номере сигнала
   * @throw std::system_error При ошибке signalfd
   *
   * @code
   * router.registerHandler(SIGTERM, [](int) { engine.stop(); });
   * @endcode
   */
  void registerHandler(int signum, Handler handler);

  /**
   * @brief Удалить все обработчики сигнала и вернуть ему обычную доставку
   * @throw std::invalid_argument При неверном номере сигнала
   */
  void unregisterHandler(int signum);

  /**
   * @brief Запустить поток обработки сигналов
   * @note Повторный вызов игнорируется
   */
  void start();

  void stop() noexcept;

  bool isRunning() const noexcept { return running_.load(); }

  ~SignalRouter();

 private:
  SignalRouter();
  void processSignals();
  static void validateSignal(int signum);

  std::unordered_map<int, std::vector<Handler>> handlers_;
  std::mutex handlers_mutex_;
  std::atomic<bool> running_{false};
  std::thread worker_thread_;
  int signal_fd_ = -1;
  sigset_t original_mask_;
  sigset_t blocked_mask_{};
};

}  // namespace kirei
