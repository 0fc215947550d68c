#pragma once

#include <pthread.h>

#include <csignal>
#include <initializer_list>

namespace kirei {

/**
 * @brief Блокирует набор сигналов в текущем потоке на время жизни объекта
 *
 * Потоки, созданные внутри области действия, наследуют маску, поэтому
 * сигналы доставляются только через SignalRouter.
 */
class SignalMaskGuard {
 public:
  explicit SignalMaskGuard(const std::initializer_list<int> &signals) {
    sigemptyset(&mask_);
    for (int sig : signals) {
      sigaddset(&mask_, sig);
    }
    pthread_sigmask(SIG_BLOCK, &mask_, &oldMask_);
  }
  // Восстанавливает предыдущую маску
  ~SignalMaskGuard() { pthread_sigmask(SIG_SETMASK, &oldMask_, nullptr); }

  SignalMaskGuard(const SignalMaskGuard &) = delete;
  SignalMaskGuard &operator=(const SignalMaskGuard &) = delete;

 private:
  sigset_t mask_;
  sigset_t oldMask_;
};

}  // namespace kirei
