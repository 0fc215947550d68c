#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <thread>

#include "kirei/SignalRouter.hpp"

using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds limit = 2000ms) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(10ms);
  }
  return true;
}

}  // namespace

// Реальный сигнал, отправленный процессу, доходит до обработчика
TEST(SignalRouterIntegration, RealSignalHandling) {
  auto& router = kirei::SignalRouter::instance();
  std::atomic<int> received{0};

  router.registerHandler(SIGUSR1, [&](int sig) { received = sig; });
  router.start();

  kill(getpid(), SIGUSR1);

  EXPECT_TRUE(waitFor([&] { return received.load() == SIGUSR1; }));
  router.stop();
  router.unregisterHandler(SIGUSR1);
}

// Все обработчики сигнала вызываются по одному разу
TEST(SignalRouterIntegration, MultipleHandlers) {
  auto& router = kirei::SignalRouter::instance();
  testing::MockFunction<void(int)> first;
  testing::MockFunction<void(int)> second;
  std::atomic<int> calls{0};

  EXPECT_CALL(first, Call(SIGUSR2)).WillOnce([&](int) { ++calls; });
  EXPECT_CALL(second, Call(SIGUSR2)).WillOnce([&](int) { ++calls; });

  router.registerHandler(SIGUSR2, first.AsStdFunction());
  router.registerHandler(SIGUSR2, second.AsStdFunction());
  router.start();

  kill(getpid(), SIGUSR2);

  EXPECT_TRUE(waitFor([&] { return calls.load() == 2; }));
  router.stop();
  router.unregisterHandler(SIGUSR2);
}

// Исключение из обработчика не останавливает поток маршрутизатора
TEST(SignalRouterIntegration, ThrowingHandlerDoesNotStopRouter) {
  auto& router = kirei::SignalRouter::instance();
  std::atomic<int> calls{0};

  router.registerHandler(SIGUSR1, [](int) { throw std::runtime_error("boom"); });
  router.registerHandler(SIGUSR1, [&](int) { ++calls; });
  router.start();

  kill(getpid(), SIGUSR1);
  ASSERT_TRUE(waitFor([&] { return calls.load() == 1; }));
  EXPECT_TRUE(router.isRunning());

  kill(getpid(), SIGUSR1);
  EXPECT_TRUE(waitFor([&] { return calls.load() == 2; }));
  router.stop();
  router.unregisterHandler(SIGUSR1);
}

TEST(SignalRouterIntegration, RejectsInvalidSignals) {
  auto& router = kirei::SignalRouter::instance();
  EXPECT_THROW(router.registerHandler(SIGKILL, [](int) {}), std::invalid_argument);
  EXPECT_THROW(router.registerHandler(0, [](int) {}), std::invalid_argument);
  EXPECT_THROW(router.registerHandler(NSIG, [](int) {}), std::invalid_argument);
}

TEST(SignalRouterIntegration, DoubleStartAndStopAreSafe) {
  auto& router = kirei::SignalRouter::instance();
  router.start();
  EXPECT_NO_THROW(router.start());
  EXPECT_TRUE(router.isRunning());
  router.stop();
  router.stop();
  EXPECT_FALSE(router.isRunning());
}
