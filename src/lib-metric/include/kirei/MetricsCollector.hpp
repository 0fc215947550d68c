/**
 * @file MetricsCollector.hpp
 * @brief Сбор счётчиков и времени выполнения задач в формате Prometheus
 *
 * @details Потокобезопасно накапливает:
 * - счётчики (перемещённые и удалённые файлы, ошибки, события наблюдателя);
 * - суммарное время и число запусков периодических задач.
 *
 * Экспорт в текстовый формат Prometheus выполняется по запросу.
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace kirei {

/**
 * @class MetricsCollector
 * @brief Потокобезопасный сборщик метрик (Singleton)
 */
class MetricsCollector {
public:
    static MetricsCollector& instance();

    /**
     * @brief Зарегистрировать новый счётчик
     * @param name Уникальное имя ([a-zA-Z_][a-zA-Z0-9_]*)
     * @param help Описание метрики для Prometheus
     * @throw std::runtime_error Если имя пустое или счётчик уже зарегистрирован
     */
    void registerCounter(const std::string& name, const std::string& help = "");

    /// Возвращает true, если счётчик с таким именем уже зарегистрирован
    bool hasCounter(const std::string& name) const;

    /**
     * @brief Увеличить значение счётчика
     * @warning Незарегистрированные имена молча игнорируются
     */
    void incrementCounter(const std::string& name, double value = 1.0);

    std::optional<double> counterValue(const std::string& name) const;

    /**
     * @brief Записать время выполнения задачи
     * @note Для каждого имени накапливаются сумма и количество запусков
     */
    void recordTaskTime(const std::string& name, std::chrono::milliseconds duration);

    std::uint64_t taskRunCount(const std::string& name) const;

    /**
     * @brief Экспорт метрик в текстовом формате Prometheus
     *
     * @code
     * # TYPE kirei_files_moved counter
     * kirei_files_moved 12
     * @endcode
     */
    std::string exportPrometheus() const;

private:
    MetricsCollector() = default;

    struct Metric {
        double value = 0.0;
        std::string help;
    };

    struct TaskTime {
        std::uint64_t sumMs = 0;
        std::uint64_t count = 0;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Metric> counters_;
    std::map<std::string, TaskTime> taskTimes_;
};

}  // namespace kirei
