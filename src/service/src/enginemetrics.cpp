#include "../include/enginemetrics.hpp"

#include <mutex>
#include <utility>

#include "kirei/MetricsCollector.hpp"

namespace kirei {
namespace metrics {

void registerEngineMetrics() {
  static std::once_flag once;
  std::call_once(once, [] {
    auto &collector = MetricsCollector::instance();
    const std::pair<const char *, const char *> counters[] = {
        {kFilesMoved, "Files relocated by organization rules"},
        {kFilesDeleted, "Files and folders removed by cleanup or deduplication"},
        {kMoveFailures, "Moves that left the source in place"},
        {kDeleteFailures, "Entries that could not be removed"},
        {kWatchEvents, "Creation events received from monitored folders"},
        {kWatchOverflows, "Kernel event queue overflows (events lost)"},
        {kDuplicateGroups, "Duplicate groups found across all scans"},
        {kStrategyFailures, "Strategy invocations that raised an error"},
    };
    for (const auto &[name, help] : counters) {
      if (!collector.hasCounter(name)) collector.registerCounter(name, help);
    }
  });
}

}  // namespace metrics
}  // namespace kirei
