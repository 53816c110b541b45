/**
 * @file vg_metrics.h
 * @brief VoiceGate - Metrics Sink
 *
 * The pipeline reports counters ("wake_word_detected", "speaker_verified", ...)
 * and timings ("wake_to_verify_ms") to an IMetricsSink supplied by the host.
 * Calls are synchronous and must return quickly.
 *
 * InMemoryMetricsSink is the reference sink used by tests and local
 * deployments; NullMetricsSink discards everything.
 */

#ifndef VG_METRICS_H
#define VG_METRICS_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace voicegate {

// Counter names emitted by the core
namespace metric {
constexpr const char* kWakeWordDetected = "wake_word_detected";
constexpr const char* kSpeechRejectedShort = "speech_rejected_short";
constexpr const char* kSpeakerVerified = "speaker_verified";
constexpr const char* kSpeakerRejected = "speaker_rejected";
constexpr const char* kWakeToVerifyMs = "wake_to_verify_ms";
constexpr const char* kAsrLocal = "asr_local";
constexpr const char* kAsrRemoteFallback = "asr_remote_fallback";
constexpr const char* kAsrRemoteFailed = "asr_remote_failed";
constexpr const char* kAsrStreamTimeout = "asr_stream_timeout";
constexpr const char* kAsrLatencyMs = "asr_latency_ms";
}  // namespace metric

using CounterSnapshot = std::map<std::string, int64_t>;

class IMetricsSink {
   public:
    virtual ~IMetricsSink() = default;

    virtual void increment(const std::string& name, int64_t value = 1) = 0;
    virtual void record_timing(const std::string& name, double milliseconds) = 0;
    virtual CounterSnapshot snapshot() const = 0;
};

class NullMetricsSink : public IMetricsSink {
   public:
    void increment(const std::string&, int64_t = 1) override {}
    void record_timing(const std::string&, double) override {}
    CounterSnapshot snapshot() const override { return {}; }
};

struct TimingSummary {
    size_t count = 0;
    double mean_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
};

/**
 * Timing summaries are running aggregates over every sample ever recorded;
 * only the most recent kMaxTimingSamples raw samples per name are retained.
 */
class InMemoryMetricsSink : public IMetricsSink {
   public:
    static constexpr size_t kMaxTimingSamples = 1024;

    void increment(const std::string& name, int64_t value = 1) override;
    void record_timing(const std::string& name, double milliseconds) override;
    CounterSnapshot snapshot() const override;

    // Counter value, 0 if never incremented
    int64_t counter(const std::string& name) const;

    // Most recent samples, oldest first
    std::vector<double> timings(const std::string& name) const;
    TimingSummary timing_summary(const std::string& name) const;

    // Wall-clock ms of the last update to a counter, 0 if never updated
    int64_t last_updated_ms(const std::string& name) const;

    nlohmann::json to_json() const;
    void reset();

   private:
    mutable std::mutex mutex_;
    std::map<std::string, int64_t> counters_;
    std::map<std::string, int64_t> last_updated_;
    struct TimingSeries {
        TimingSummary summary;
        double sum_ms = 0.0;
        std::deque<double> recent;
    };

    std::map<std::string, TimingSeries> timings_;
};

}  // namespace voicegate

#endif  // VG_METRICS_H
