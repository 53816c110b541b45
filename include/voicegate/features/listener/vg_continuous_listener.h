/**
 * @file vg_continuous_listener.h
 * @brief VoiceGate - Continuous Listener
 *
 * Turns an unbounded frame stream into at most one verified command per
 * listen_for_command() call:
 *
 *   Idle -> WakeDetected -> Capturing -> GuardrailEvaluation -> Verifying
 *        -> Verified | Rejected
 *
 * Scan:      receive frames until the detector fires. A source that closes
 *            first gives VG_ERROR_SOURCE_CLOSED.
 * Capture:   trigger frame + following frames until silence_after_frames
 *            consecutive silent frames, the frame ceiling, the capture
 *            deadline (max_command_seconds after the trigger) or the end of
 *            the source.
 * Guardrail: at least min_command_frames frames and min_speech_frames
 *            non-silent frames, else VG_ERROR_SPEECH_TOO_SHORT.
 * Verify:    SpeakerVerifier::verify_owner on the whole capture. Its errors
 *            are returned unchanged.
 *
 * Silence follows is_silent_frame() in vg_audio_utils.h.
 *
 * The listener borrows the detector, verifier, source and metrics sink;
 * all of them must outlive it. One consumer thread only.
 */

#ifndef VG_CONTINUOUS_LISTENER_H
#define VG_CONTINUOUS_LISTENER_H

#include <cstddef>
#include <optional>
#include <vector>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_metrics.h"
#include "voicegate/core/vg_types.h"
#include "voicegate/features/listener/vg_frame_source.h"
#include "voicegate/features/speaker/vg_speaker_verifier.h"
#include "voicegate/features/wakeword/vg_wakeword.h"

namespace voicegate {

enum class ListenerState {
    Idle,
    WakeDetected,
    Capturing,
    GuardrailEvaluation,
    Verifying,
    Verified,
    Rejected,
};

enum class CaptureStopReason {
    None,             // capture never started
    Silence,          // silence_after_frames consecutive silent frames
    FrameCeiling,     // frame ceiling reached
    Deadline,         // max_command_seconds elapsed since the trigger
    SourceExhausted,  // source closed mid-capture
};

const char* listener_state_name(ListenerState state);
const char* capture_stop_reason_name(CaptureStopReason reason);

/**
 * What happened during the last listen_for_command() call: the furthest
 * stage reached, the metric counter that decided the outcome, and the
 * capture statistics.
 */
struct ListenReport {
    ListenerState stage = ListenerState::Idle;
    const char* counter = nullptr;
    CaptureStopReason stop_reason = CaptureStopReason::None;
    size_t frames_scanned = 0;
    size_t frames_captured = 0;
    size_t non_silent_frames = 0;
    std::optional<float> similarity;
    std::optional<double> wake_to_verify_ms;
    vg_result_t result = VG_SUCCESS;
};

class ContinuousListener {
   public:
    ContinuousListener(IWakeWordDetector& detector, SpeakerVerifier& verifier,
                       FrameSource& source, const ListenerConfig& config = ListenerConfig(),
                       IMetricsSink* metrics = nullptr);

    ContinuousListener(const ContinuousListener&) = delete;
    ContinuousListener& operator=(const ContinuousListener&) = delete;

    /**
     * Block until a command is captured and verified, or a stage fails.
     * On success out holds the captured frames at config.sample_rate.
     * Failures are never retried internally.
     */
    vg_result_t listen_for_command(VerifiedAudio& out);

    // Idle, Verified or Rejected between calls
    ListenerState state() const { return state_; }

    const ListenReport& last_report() const { return report_; }

    // max(1, floor(max_command_seconds * sample_rate / 1024))
    size_t frame_ceiling() const { return frame_ceiling_; }

    const ListenerConfig& config() const { return config_; }

   private:
    vg_result_t scan(AudioFrame& trigger);
    CaptureStopReason capture(AudioFrame trigger, std::vector<AudioFrame>& frames);
    bool passes_guardrails(const std::vector<AudioFrame>& frames);
    vg_result_t finish(ListenerState terminal, vg_result_t rc);

    IWakeWordDetector& detector_;
    SpeakerVerifier& verifier_;
    FrameSource& source_;
    ListenerConfig config_;
    NullMetricsSink null_metrics_;
    IMetricsSink* metrics_;

    size_t frame_ceiling_;
    ListenerState state_ = ListenerState::Idle;
    ListenReport report_;
};

}  // namespace voicegate

#endif  // VG_CONTINUOUS_LISTENER_H
