/**
 * @file continuous_listener.cpp
 * @brief VoiceGate - Continuous Listener Implementation
 */

#include "voicegate/features/listener/vg_continuous_listener.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

#include "voicegate/core/vg_audio_utils.h"
#include "voicegate/core/vg_clock.h"
#include "voicegate/core/vg_logger.h"

static const char* LOG_CAT = "Listener";

namespace voicegate {

namespace {

// Frames per second assumes 1024-sample frames
constexpr double kSamplesPerFrame = 1024.0;

size_t compute_frame_ceiling(const ListenerConfig& config) {
    const double frames =
        std::floor(config.max_command_seconds * static_cast<double>(config.sample_rate) /
                   kSamplesPerFrame);
    if (!(frames >= 1.0)) {
        return 1;
    }
    if (frames >= static_cast<double>(std::numeric_limits<size_t>::max())) {
        return std::numeric_limits<size_t>::max();
    }
    return static_cast<size_t>(frames);
}

// now + seconds, saturating at Deadline::max() instead of overflowing the clock's rep
Deadline deadline_after(double seconds) {
    const Deadline now = SteadyClock::now();
    const std::chrono::duration<double> budget(seconds);
    const std::chrono::duration<double> headroom = Deadline::max() - now;
    if (!(budget < headroom - std::chrono::seconds(1))) {
        return Deadline::max();
    }
    return now + std::chrono::duration_cast<SteadyClock::duration>(budget);
}

}  // namespace

const char* listener_state_name(ListenerState state) {
    switch (state) {
        case ListenerState::Idle:
            return "idle";
        case ListenerState::WakeDetected:
            return "wake_detected";
        case ListenerState::Capturing:
            return "capturing";
        case ListenerState::GuardrailEvaluation:
            return "guardrail_evaluation";
        case ListenerState::Verifying:
            return "verifying";
        case ListenerState::Verified:
            return "verified";
        case ListenerState::Rejected:
            return "rejected";
        default:
            return "unknown";
    }
}

const char* capture_stop_reason_name(CaptureStopReason reason) {
    switch (reason) {
        case CaptureStopReason::None:
            return "none";
        case CaptureStopReason::Silence:
            return "silence";
        case CaptureStopReason::FrameCeiling:
            return "frame_ceiling";
        case CaptureStopReason::Deadline:
            return "deadline";
        case CaptureStopReason::SourceExhausted:
            return "source_exhausted";
        default:
            return "unknown";
    }
}

ContinuousListener::ContinuousListener(IWakeWordDetector& detector, SpeakerVerifier& verifier,
                                       FrameSource& source, const ListenerConfig& config,
                                       IMetricsSink* metrics)
    : detector_(detector),
      verifier_(verifier),
      source_(source),
      config_(config),
      metrics_(metrics != nullptr ? metrics : &null_metrics_),
      frame_ceiling_(compute_frame_ceiling(config)) {}

// =============================================================================
// LISTEN
// =============================================================================

vg_result_t ContinuousListener::listen_for_command(VerifiedAudio& out) {
    report_ = ListenReport();
    state_ = ListenerState::Idle;
    VG_LOG_DEBUG(LOG_CAT, "Starting continuous listen loop");

    AudioFrame trigger;
    vg_result_t rc = scan(trigger);
    if (VG_FAILED(rc)) {
        return finish(ListenerState::Idle, rc);
    }

    const double wake_ms = monotonic_now_ms();
    state_ = ListenerState::WakeDetected;
    report_.stage = state_;
    report_.counter = metric::kWakeWordDetected;
    metrics_->increment(metric::kWakeWordDetected);
    VG_LOG_INFO(LOG_CAT, "Wake word detected; capturing command audio");

    std::vector<AudioFrame> frames;
    report_.stop_reason = capture(std::move(trigger), frames);
    report_.frames_captured = frames.size();
    VG_LOG_DEBUG(LOG_CAT, "Captured %zu frames (stop: %s)", frames.size(),
                 capture_stop_reason_name(report_.stop_reason));

    state_ = ListenerState::GuardrailEvaluation;
    report_.stage = state_;
    if (!passes_guardrails(frames)) {
        metrics_->increment(metric::kSpeakerRejected);
        metrics_->increment(metric::kSpeechRejectedShort);
        report_.counter = metric::kSpeechRejectedShort;
        VG_LOG_WARNING(LOG_CAT, "Insufficient speech captured (%zu frames, %zu non-silent)",
                       frames.size(), report_.non_silent_frames);
        vg_error_set_details("insufficient speech captured for verification");
        return finish(ListenerState::Rejected, VG_ERROR_SPEECH_TOO_SHORT);
    }

    state_ = ListenerState::Verifying;
    report_.stage = state_;
    float similarity = 0.0f;
    rc = verifier_.verify_owner(frames, config_.sample_rate, similarity);
    if (rc == VG_SUCCESS || rc == VG_ERROR_SPEAKER_MISMATCH) {
        report_.similarity = similarity;
    }
    if (VG_FAILED(rc)) {
        metrics_->increment(metric::kSpeakerRejected);
        report_.counter = metric::kSpeakerRejected;
        VG_LOG_WARNING(LOG_CAT, "Speaker verification failed: %s", vg_error_code_name(rc));
        return finish(ListenerState::Rejected, rc);
    }

    const double elapsed_ms = monotonic_now_ms() - wake_ms;
    metrics_->increment(metric::kSpeakerVerified);
    metrics_->record_timing(metric::kWakeToVerifyMs, elapsed_ms);
    report_.counter = metric::kSpeakerVerified;
    report_.wake_to_verify_ms = elapsed_ms;
    VG_LOG_INFO(LOG_CAT, "Speaker verified in %.1f ms; emitting %zu frames", elapsed_ms,
                frames.size());

    out = VerifiedAudio(std::move(frames), config_.sample_rate);
    return finish(ListenerState::Verified, VG_SUCCESS);
}

// =============================================================================
// STAGES
// =============================================================================

vg_result_t ContinuousListener::scan(AudioFrame& trigger) {
    AudioFrame frame;
    for (;;) {
        const ReceiveStatus status = source_.receive(frame);
        if (status == ReceiveStatus::Closed) {
            VG_LOG_WARNING(LOG_CAT, "Audio source closed after %zu frames without a wake word",
                           report_.frames_scanned);
            vg_error_set_details("audio source closed before wake word detected");
            return VG_ERROR_SOURCE_CLOSED;
        }
        if (status == ReceiveStatus::Timeout) {
            continue;
        }
        ++report_.frames_scanned;
        if (detector_.heard(frame)) {
            trigger = std::move(frame);
            return VG_SUCCESS;
        }
    }
}

CaptureStopReason ContinuousListener::capture(AudioFrame trigger,
                                              std::vector<AudioFrame>& frames) {
    state_ = ListenerState::Capturing;
    report_.stage = state_;

    const Deadline deadline = deadline_after(config_.max_command_seconds);

    frames.clear();
    frames.push_back(std::move(trigger));
    int silent_run = 0;

    for (;;) {
        if (frames.size() >= frame_ceiling_) {
            VG_LOG_DEBUG(LOG_CAT, "Reached max command duration; stopping capture");
            return CaptureStopReason::FrameCeiling;
        }

        AudioFrame frame;
        const ReceiveStatus status = source_.receive(frame, deadline);
        if (status == ReceiveStatus::Closed) {
            return CaptureStopReason::SourceExhausted;
        }
        if (status == ReceiveStatus::Timeout) {
            VG_LOG_DEBUG(LOG_CAT, "Capture deadline elapsed; stopping capture");
            return CaptureStopReason::Deadline;
        }

        if (is_silent_frame(frame, config_.energy_threshold)) {
            ++silent_run;
        } else {
            silent_run = 0;
        }
        frames.push_back(std::move(frame));

        if (silent_run >= config_.silence_after_frames) {
            VG_LOG_DEBUG(LOG_CAT, "Detected sustained silence; stopping capture");
            return CaptureStopReason::Silence;
        }
    }
}

bool ContinuousListener::passes_guardrails(const std::vector<AudioFrame>& frames) {
    report_.non_silent_frames = count_non_silent(frames, config_.energy_threshold);
    return frames.size() >= static_cast<size_t>(std::max(0, config_.min_command_frames)) &&
           report_.non_silent_frames >= static_cast<size_t>(std::max(0, config_.min_speech_frames));
}

vg_result_t ContinuousListener::finish(ListenerState terminal, vg_result_t rc) {
    state_ = terminal;
    if (terminal != ListenerState::Idle) {
        report_.stage = terminal;
    }
    report_.result = rc;
    return rc;
}

}  // namespace voicegate
