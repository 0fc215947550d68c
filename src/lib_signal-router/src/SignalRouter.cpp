#include "kirei/SignalRouter.hpp"

#include <sys/epoll.h>

#include <cerrno>
#include <cstring>

#include "kirei/compositelogger.hpp"

namespace kirei {

SignalRouter::SignalRouter() {
  sigemptyset(&blocked_mask_);
  if (sigprocmask(SIG_SETMASK, nullptr, &original_mask_) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "sigprocmask(GET) failed");
  }
  if ((signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC)) ==
      -1)
    throw std::system_error(errno, std::system_category(),
                            "signalfd create failed");
}

void SignalRouter::validateSignal(int signum) {
  if (signum <= 0 || signum >= NSIG || signum == SIGKILL ||
      signum == SIGSTOP) {
    throw std::invalid_argument("Invalid signal number: " +
                                std::to_string(signum));
  }
}

void SignalRouter::registerHandler(int signum, Handler handler) {
  validateSignal(signum);

  std::lock_guard<std::mutex> lock(handlers_mutex_);

  sigaddset(&blocked_mask_, signum);
  pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr);

  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd configure failed");
  }

  handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
  validateSignal(signum);

  std::lock_guard<std::mutex> lock(handlers_mutex_);
  handlers_.erase(signum);

  if (!sigismember(&blocked_mask_, signum)) return;
  sigdelset(&blocked_mask_, signum);
  if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
    throw std::system_error(errno, std::system_category(),
                            "signalfd configure failed");
  }
  if (!sigismember(&original_mask_, signum)) {
    sigset_t single_mask;
    sigemptyset(&single_mask);
    sigaddset(&single_mask, signum);
    pthread_sigmask(SIG_UNBLOCK, &single_mask, nullptr);
  }
}

void SignalRouter::start() {
  if (running_.exchange(true)) return;
  // Поток мог завершиться сам после ошибки epoll
  if (worker_thread_.joinable()) worker_thread_.join();
  worker_thread_ = std::thread(&SignalRouter::processSignals, this);
}

void SignalRouter::processSignals() {
  auto& logger = CompositeLogger::instance();
  constexpr int MAX_EVENTS = 10;
  struct epoll_event ev, events[MAX_EVENTS];

  int epoll_fd = epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd == -1) {
    logger.error("SignalRouter: epoll_create1 failed: " +
                 std::string(std::strerror(errno)));
    running_ = false;
    return;
  }

  ev.events = EPOLLIN;
  ev.data.fd = signal_fd_;
  if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, signal_fd_, &ev) == -1) {
    logger.error("SignalRouter: epoll_ctl failed: " +
                 std::string(std::strerror(errno)));
    close(epoll_fd);
    running_ = false;
    return;
  }

  while (running_) {
    int nfds = epoll_wait(epoll_fd, events, MAX_EVENTS, 500);
    if (nfds == -1) {
      if (errno == EINTR) continue;
      logger.error("SignalRouter: epoll_wait failed: " +
                   std::string(std::strerror(errno)));
      break;
    }

    for (int i = 0; i < nfds; ++i) {
      if (events[i].data.fd != signal_fd_) continue;

      struct signalfd_siginfo fdsi;
      while (read(signal_fd_, &fdsi, sizeof(fdsi)) ==
             static_cast<ssize_t>(sizeof(fdsi))) {
        const int signo = static_cast<int>(fdsi.ssi_signo);
        std::vector<Handler> targets;
        {
          std::lock_guard<std::mutex> lock(handlers_mutex_);
          if (auto it = handlers_.find(signo); it != handlers_.end()) {
            targets = it->second;
          }
        }
        // Обработчики вызываются без блокировки: им разрешено
        // регистрировать новые обработчики
        for (auto& handler : targets) {
          try {
            handler(signo);
          } catch (const std::exception& e) {
            logger.error("SignalRouter: handler for signal " +
                         std::to_string(signo) + " threw: " + e.what());
          }
        }
      }
    }
  }

  close(epoll_fd);
}

void SignalRouter::stop() noexcept {
  running_ = false;
  if (worker_thread_.joinable() &&
      worker_thread_.get_id() != std::this_thread::get_id()) {
    worker_thread_.join();
  }
}

SignalRouter::~SignalRouter() {
  stop();
  if (worker_thread_.joinable()) worker_thread_.detach();
  close(signal_fd_);
  sigprocmask(SIG_SETMASK, &original_mask_, nullptr);
}

}  // namespace kirei
