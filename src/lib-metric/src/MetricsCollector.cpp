#include "kirei/MetricsCollector.hpp"

#include <sstream>
#include <stdexcept>

namespace kirei {

namespace {
const char* const kPrefix = "kirei_";
}

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector instance;
    return instance;
}

void MetricsCollector::registerCounter(const std::string& name, const std::string& help) {
    if (name.empty()) {
        throw std::runtime_error("Metric name must not be empty");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (counters_.count(name)) {
        throw std::runtime_error("Metric already registered: " + name);
    }
    counters_[name].help = help;
}

bool MetricsCollector::hasCounter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_.count(name) != 0;
}

void MetricsCollector::incrementCounter(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = counters_.find(name); it != counters_.end()) {
        it->second.value += value;
    }
}

std::optional<double> MetricsCollector::counterValue(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    if (it == counters_.end()) return std::nullopt;
    return it->second.value;
}

void MetricsCollector::recordTaskTime(const std::string& name, std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = taskTimes_[name];
    entry.sumMs += static_cast<std::uint64_t>(duration.count() < 0 ? 0 : duration.count());
    ++entry.count;
}

std::uint64_t MetricsCollector::taskRunCount(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = taskTimes_.find(name);
    return it == taskTimes_.end() ? 0 : it->second.count;
}

std::string MetricsCollector::exportPrometheus() const {
    std::ostringstream ss;
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& [name, metric] : counters_) {
        if (!metric.help.empty()) {
            ss << "# HELP " << kPrefix << name << " " << metric.help << "\n";
        }
        ss << "# TYPE " << kPrefix << name << " counter\n";
        ss << kPrefix << name << " " << metric.value << "\n";
    }

    for (const auto& [name, time] : taskTimes_) {
        ss << "# TYPE " << kPrefix << "task_time_ms summary\n";
        ss << kPrefix << "task_time_ms_sum{task=\"" << name << "\"} " << time.sumMs << "\n";
        ss << kPrefix << "task_time_ms_count{task=\"" << name << "\"} " << time.count << "\n";
    }

    return ss.str();
}

}  // namespace kirei
