#pragma once

namespace kirei {
namespace metrics {

inline constexpr const char *kFilesMoved = "files_moved";
inline constexpr const char *kFilesDeleted = "files_deleted";
inline constexpr const char *kMoveFailures = "move_failures";
inline constexpr const char *kDeleteFailures = "delete_failures";
inline constexpr const char *kWatchEvents = "watch_events";
inline constexpr const char *kWatchOverflows = "watch_overflows";
inline constexpr const char *kDuplicateGroups = "duplicate_groups";
inline constexpr const char *kStrategyFailures = "strategy_failures";

/**
 * @brief Регистрирует счётчики движка в MetricsCollector
 * @note Повторные вызовы безопасны: регистрация выполняется один раз
 */
void registerEngineMetrics();

}  // namespace metrics
}  // namespace kirei
