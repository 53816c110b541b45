/**
 * @file transcription_router.cpp
 * @brief VoiceGate - Local/Remote Transcription Routing Implementation
 */

#include "voicegate/features/stt/vg_transcription_router.h"

#include <chrono>
#include <string>

#include "voicegate/core/vg_clock.h"
#include "voicegate/core/vg_logger.h"

static const char* LOG_CAT = "ASR";

namespace voicegate {

TranscriptionRouter::TranscriptionRouter(std::unique_ptr<ITranscriber> local,
                                         std::unique_ptr<ITranscriber> remote,
                                         const RouterConfig& config, IMetricsSink* metrics)
    : local_(std::move(local)),
      remote_(std::move(remote)),
      config_(config),
      metrics_(metrics != nullptr ? metrics : &null_metrics_) {}

vg_result_t TranscriptionRouter::from_config(const VoiceGateConfig& config,
                                             std::unique_ptr<TranscriptionRouter>& out,
                                             IMetricsSink* metrics) {
    std::unique_ptr<ITranscriber> remote;
    vg_result_t rc = create_remote_transcriber(config, remote);
    if (VG_FAILED(rc)) {
        return rc;
    }
    out = std::make_unique<TranscriptionRouter>(std::make_unique<LocalTextTranscriber>(),
                                                std::move(remote), config.router, metrics);
    return VG_SUCCESS;
}

vg_result_t TranscriptionRouter::transcribe(const std::vector<AudioFrame>& frames,
                                            int sample_rate, TranscriptionResult& out) {
    return route(frames, sample_rate, "", "", out);
}

vg_result_t TranscriptionRouter::transcribe_streaming(FrameSource& source, int sample_rate,
                                                      TranscriptionResult& out) {
    const auto budget = std::chrono::milliseconds(config_.stream_timeout_ms);
    const Deadline deadline = SteadyClock::now() + budget;

    std::vector<AudioFrame> frames;
    for (;;) {
        AudioFrame frame;
        const ReceiveStatus status = source.receive(frame, deadline);
        if (status == ReceiveStatus::Frame) {
            frames.push_back(std::move(frame));
            continue;
        }
        if (status == ReceiveStatus::Timeout) {
            metrics_->increment(metric::kAsrStreamTimeout);
            VG_LOG_WARNING(LOG_CAT, "Streaming collection timed out after %d ms with %zu frames",
                           config_.stream_timeout_ms, frames.size());
        }
        break;
    }

    return route(frames, sample_rate, "_local_stream", "_stream", out);
}

vg_result_t TranscriptionRouter::route(const std::vector<AudioFrame>& frames, int sample_rate,
                                       const char* local_tag, const char* remote_tag,
                                       TranscriptionResult& out) {
    const double start_ms = monotonic_now_ms();

    TranscriptionResult local;
    vg_result_t rc = local_->transcribe(frames, sample_rate, local);
    if (VG_SUCCEEDED(rc) && local.confidence >= config_.confidence_threshold) {
        local.source += local_tag;
        local.latency_ms = monotonic_now_ms() - start_ms;
        metrics_->increment(metric::kAsrLocal);
        metrics_->record_timing(metric::kAsrLatencyMs, *local.latency_ms);
        out = std::move(local);
        return VG_SUCCESS;
    }
    if (VG_FAILED(rc)) {
        VG_LOG_WARNING(LOG_CAT, "Local ASR failed (%s); using remote backend",
                       vg_error_code_name(rc));
    } else {
        VG_LOG_DEBUG(LOG_CAT, "Local confidence %.2f < %.2f; using remote backend",
                     local.confidence, config_.confidence_threshold);
    }

    metrics_->increment(metric::kAsrRemoteFallback);
    TranscriptionResult remote;
    rc = remote_->transcribe(frames, sample_rate, remote);
    if (VG_FAILED(rc)) {
        // Every remote failure surfaces as REMOTE_BACKEND; the backend's details are kept
        metrics_->increment(metric::kAsrRemoteFailed);
        const std::string details = vg_error_get_details();
        const std::string message = std::string("remote backend ") + remote_->name() + " failed (" +
                                    vg_error_code_name(rc) + ")" +
                                    (details.empty() ? "" : ": " + details);
        VG_LOG_ERROR(LOG_CAT, "%s", message.c_str());
        vg_error_set_details(message.c_str());
        return VG_ERROR_REMOTE_BACKEND;
    }

    remote.source += remote_tag;
    remote.latency_ms = monotonic_now_ms() - start_ms;
    metrics_->record_timing(metric::kAsrLatencyMs, *remote.latency_ms);
    out = std::move(remote);
    return VG_SUCCESS;
}

}  // namespace voicegate
