/**
 * @file vg_metrics.cpp
 * @brief VoiceGate - In-Memory Metrics Sink
 *
 * Collects counters and timing samples behind one mutex. The core is the
 * only writer in the reference deployment; readers (snapshot, to_json) may
 * run on other threads.
 */

#include "voicegate/core/vg_metrics.h"

#include <algorithm>

#include "voicegate/core/vg_clock.h"

namespace voicegate {

void InMemoryMetricsSink::increment(const std::string& name, int64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += value;
    last_updated_[name] = wall_clock_now_ms();
}

void InMemoryMetricsSink::record_timing(const std::string& name, double milliseconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimingSeries& series = timings_[name];
    TimingSummary& summary = series.summary;
    if (summary.count == 0) {
        summary.min_ms = milliseconds;
        summary.max_ms = milliseconds;
    } else {
        summary.min_ms = std::min(summary.min_ms, milliseconds);
        summary.max_ms = std::max(summary.max_ms, milliseconds);
    }
    ++summary.count;
    series.sum_ms += milliseconds;
    summary.mean_ms = series.sum_ms / static_cast<double>(summary.count);

    series.recent.push_back(milliseconds);
    if (series.recent.size() > kMaxTimingSamples) {
        series.recent.pop_front();
    }
}

CounterSnapshot InMemoryMetricsSink::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

int64_t InMemoryMetricsSink::counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return it == counters_.end() ? 0 : it->second;
}

std::vector<double> InMemoryMetricsSink::timings(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timings_.find(name);
    if (it == timings_.end()) {
        return {};
    }
    return std::vector<double>(it->second.recent.begin(), it->second.recent.end());
}

TimingSummary InMemoryMetricsSink::timing_summary(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = timings_.find(name);
    return it == timings_.end() ? TimingSummary() : it->second.summary;
}

int64_t InMemoryMetricsSink::last_updated_ms(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_updated_.find(name);
    return it == last_updated_.end() ? 0 : it->second;
}

nlohmann::json InMemoryMetricsSink::to_json() const {
    nlohmann::json j;
    j["counters"] = nlohmann::json::object();
    j["timings"] = nlohmann::json::object();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : counters_) {
        j["counters"][kv.first] = kv.second;
    }
    for (const auto& kv : timings_) {
        const TimingSummary& s = kv.second.summary;
        j["timings"][kv.first] = {{"count", s.count},
                                  {"mean_ms", s.mean_ms},
                                  {"min_ms", s.min_ms},
                                  {"max_ms", s.max_ms}};
    }
    return j;
}

void InMemoryMetricsSink::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    last_updated_.clear();
    timings_.clear();
}

}  // namespace voicegate
