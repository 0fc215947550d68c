/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 */

#include "../include/service_controller.hpp"

#include <signal.h>

#include <cstdlib>
#include <iostream>
#include <type_traits>

#include "../include/configmanager.hpp"
#include "../include/engineconfig.hpp"
#include "../include/signal_mask_guard.hpp"
#include "kirei/MetricsCollector.hpp"
#include "kirei/SignalRouter.hpp"
#include "kirei/asyncfilelogger.hpp"
#include "kirei/compositelogger.hpp"
#include "kirei/consolelogger.hpp"
#include "kirei/syncfilelogger.hpp"

namespace kirei {

ServiceController::~ServiceController() { shutdown(); }

int ServiceController::run(int argc, char **argv) {
  // Потоки движка наследуют маску; сигналы читает только SignalRouter
  SignalMaskGuard guard({SIGINT, SIGTERM});

  try {
    ArgumentParser parser;
    ParsedArgs args = parser.parse(argc, argv);

    if (args.help_message) {
      printHelp();
      return EXIT_SUCCESS;
    }
    if (args.version_message) {
      printVersion();
      return EXIT_SUCCESS;
    }

    ConfigManager::instance().initialize(args.config_path);
    initLogger(args);
    CompositeLogger::instance().info("Service controller: configuration loaded from " +
                                     ConfigManager::instance().getConfigFilePath());

    engine_ = std::make_unique<KireiEngine>(
        ConfigManager::instance().getEngineConfig());

    registerSignalHandlers();
    SignalRouter::instance().start();
    CompositeLogger::instance().info("SignalRouter started successfully");

    engine_->start();

    shutdown();
    return EXIT_SUCCESS;
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    CompositeLogger::instance().critical(e.what());
    shutdown();
    return EXIT_FAILURE;
  }
}

void ServiceController::initLogger(const ParsedArgs &args) {
  auto &composite_logger = CompositeLogger::instance();

  // Лямбда для безопасного создания shared_ptr из синглтона
  auto getSingletonPtr = [](auto &singleton) {
    return std::shared_ptr<std::remove_reference_t<decltype(singleton)>>(
        &singleton, [](auto *) {});
  };

  if (!args.use_cli_logging) {
    auto logging = ConfigManager::instance().getLoggingConfig();
    for (auto &entry : logging) {
      std::string type = entry.value("type", "console");
      std::string level = entry.value("level", "info");
      std::string file = entry.value("file", "kirei.log");

      if (type == "console") {
        auto &logger = ConsoleLogger::instance();
        logger.setLogLevel(stringToLogLevel(level));
        composite_logger.addLogger(getSingletonPtr(logger));
      } else if (type == "async_file") {
        auto &logger = AsyncFileLogger::instance();
        logger.setMainLogPath(file);
        logger.setLogLevel(stringToLogLevel(level));
        logger.setRotationConfig(rotationFromJson(entry));
        composite_logger.addLogger(getSingletonPtr(logger));
      } else if (type == "sync_file") {
        auto &logger = SyncFileLogger::instance();
        logger.setMainLogPath(file);
        logger.setLogLevel(stringToLogLevel(level));
        logger.setRotationConfig(rotationFromJson(entry));
        composite_logger.addLogger(getSingletonPtr(logger));
      }
    }
  } else {
    for (const auto &type : args.logger_types) {
      if (type == "console") {
        composite_logger.addLogger(getSingletonPtr(ConsoleLogger::instance()));
      } else if (type == "async_file") {
        auto &logger = AsyncFileLogger::instance();
        logger.setMainLogPath("kirei_async.log");
        composite_logger.addLogger(getSingletonPtr(logger));
      } else if (type == "sync_file") {
        auto &logger = SyncFileLogger::instance();
        logger.setMainLogPath("kirei_sync.log");
        composite_logger.addLogger(getSingletonPtr(logger));
      }
    }
  }

  if (composite_logger.size() == 0) {
    composite_logger.addLogger(getSingletonPtr(ConsoleLogger::instance()));
  }

  if (args.log_level.has_value()) {
    composite_logger.setLogLevel(stringToLogLevel(args.log_level.value()));
  }
}

void ServiceController::registerSignalHandlers() {
  auto &router = SignalRouter::instance();
  CompositeLogger::instance().debug(
      "Service controller: Registering signal handlers ...");

  auto stopEngine = [this](int sig_num) {
    CompositeLogger::instance().info(
        "Signal " + std::to_string(sig_num) + " received, shutting down");
    if (engine_) engine_->stop();
  };
  router.registerHandler(SIGTERM, stopEngine);
  router.registerHandler(SIGINT, stopEngine);
  handlersRegistered_ = true;

  CompositeLogger::instance().info("All signal handlers registered successfully");
}

void ServiceController::shutdown() noexcept {
  if (shutdownDone_) return;
  shutdownDone_ = true;

  auto &logger = CompositeLogger::instance();
  if (engine_) engine_->stop();

  auto &router = SignalRouter::instance();
  router.stop();
  if (handlersRegistered_) {
    try {
      router.unregisterHandler(SIGTERM);
      router.unregisterHandler(SIGINT);
    } catch (const std::exception &e) {
      logger.error(std::string("Service controller: ") + e.what());
    }
    handlersRegistered_ = false;
  }

  if (engine_) {
    logger.info("Service controller: metrics summary\n" +
                MetricsCollector::instance().exportPrometheus());
  }
  logger.info("Service controller: shutdown complete");
  logger.flush();
}

void ServiceController::printHelp() const {
  std::cout << "Kirei Engine\n\n"
            << "Usage:\n"
            << " kirei_service [options]\n\n"
            << "Options:\n"
            << " --help, -h          Show this help message\n"
            << " --version, -v       Show version info\n"
            << " --config-file=FILE  Configuration file path "
               "(default: config/kirei.json)\n"
            << " --log-type=TYPES    Logger types (comma-separated) "
               "[console|sync_file|async_file]\n"
            << " --log-level=LEVEL   Logging level "
               "[debug|info|warning|error|critical]\n";
}

void ServiceController::printVersion() const {
  std::cout << "Kirei Engine v1.0.0\n";
}

}  // namespace kirei
