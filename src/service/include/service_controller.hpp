/**
 * @file service_controller.hpp
 * @brief Класс управления жизненным циклом процесса kirei_service
 *
 * @details
 * ServiceController объединяет разбор аргументов, загрузку конфигурации,
 * настройку логирования, регистрацию обработчиков сигналов и запуск
 * KireiEngine.
 *
 * @note Не потокобезопасен при параллельном вызове run()
 * @warning Ошибки инициализации завершают run() с кодом EXIT_FAILURE
 */
#pragma once

#include <memory>

#include "argumentparser.hpp"
#include "kireiengine.hpp"

namespace kirei {

/**
 * @class ServiceController
 * @brief Управляет запуском, конфигурацией и остановкой движка
 *
 * @details
 * Этапы run():
 * 1. Блокировка SIGINT/SIGTERM для всех потоков процесса
 * 2. Парсинг CLI аргументов (--help и --version завершают работу сразу)
 * 3. Загрузка конфигурации через ConfigManager::initialize()
 * 4. Инициализация логгеров
 * 5. Регистрация обработчиков в SignalRouter и запуск маршрутизатора
 * 6. Блокирующий KireiEngine::start()
 * 7. Остановка, сводка метрик, сброс буферов логгеров
 *
 * @see ArgumentParser, ConfigManager, KireiEngine, SignalRouter
 */
class ServiceController {
 public:
  ServiceController() = default;
  ~ServiceController();

  ServiceController(const ServiceController &) = delete;
  ServiceController &operator=(const ServiceController &) = delete;

  /**
   * @brief Основная точка входа сервиса
   *
   * @param[in] argc Количество аргументов командной строки
   * @param[in] argv Массив аргументов (имя программы и параметры)
   * @return EXIT_SUCCESS после штатной остановки, EXIT_FAILURE при ошибке
   * запуска
   *
   * @code
   int main(int argc, char** argv) {
       kirei::ServiceController svc;
       return svc.run(argc, argv);
   }
   @endcode
   */
  int run(int argc, char **argv);

 private:
  /**
   * @brief Подключает логгеры к CompositeLogger
   *
   * @details
   *  - Если логирование задано в CLI (--log-type, --log-level), логгеры
   *    создаются по аргументам
   *  - Иначе читается секция "logging" конфигурации:
   *    `{"type": "console|sync_file|async_file", "level": "...", "file": "..."}`
   *  - Без настроек подключается ConsoleLogger
   */
  void initLogger(const ParsedArgs &args);

  /// SIGINT и SIGTERM останавливают движок
  void registerSignalHandlers();

  /// Останавливает движок и SignalRouter, выводит метрики; идемпотентен
  void shutdown() noexcept;

  void printHelp() const;
  void printVersion() const;

  std::unique_ptr<KireiEngine> engine_;
  bool handlersRegistered_ = false;
  bool shutdownDone_ = false;
};

}  // namespace kirei
