/**
 * @file vg_transcription_router.h
 * @brief VoiceGate - Local/Remote Transcription Routing
 *
 * The local backend always runs first. Its result is returned when
 * confidence >= confidence_threshold; otherwise the remote backend runs on
 * the same frames and its result (or error) is returned as-is. There is no
 * tier after the remote one.
 *
 * Source tags:
 *   transcribe            "<local>" or "<remote>"
 *   transcribe_streaming  "<local>_local_stream" or "<remote>_stream"
 */

#ifndef VG_TRANSCRIPTION_ROUTER_H
#define VG_TRANSCRIPTION_ROUTER_H

#include <memory>
#include <vector>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_metrics.h"
#include "voicegate/core/vg_types.h"
#include "voicegate/features/listener/vg_frame_source.h"
#include "voicegate/features/stt/vg_transcriber.h"

namespace voicegate {

class TranscriptionRouter {
   public:
    TranscriptionRouter(std::unique_ptr<ITranscriber> local, std::unique_ptr<ITranscriber> remote,
                        const RouterConfig& config = RouterConfig(),
                        IMetricsSink* metrics = nullptr);

    // LocalTextTranscriber + create_remote_transcriber(config)
    static vg_result_t from_config(const VoiceGateConfig& config,
                                   std::unique_ptr<TranscriptionRouter>& out,
                                   IMetricsSink* metrics = nullptr);

    vg_result_t transcribe(const std::vector<AudioFrame>& frames, int sample_rate,
                           TranscriptionResult& out);

    vg_result_t transcribe(const VerifiedAudio& audio, TranscriptionResult& out) {
        return transcribe(audio.frames(), audio.sample_rate(), out);
    }

    /**
     * Collect frames until the source closes or stream_timeout_ms elapses,
     * then route whatever was collected (possibly nothing). The timeout is
     * never reported as an error.
     */
    vg_result_t transcribe_streaming(FrameSource& source, int sample_rate,
                                     TranscriptionResult& out);

    float confidence_threshold() const { return config_.confidence_threshold; }
    void set_confidence_threshold(float threshold) { config_.confidence_threshold = threshold; }
    int stream_timeout_ms() const { return config_.stream_timeout_ms; }
    void set_stream_timeout_ms(int timeout_ms) { config_.stream_timeout_ms = timeout_ms; }

   private:
    vg_result_t route(const std::vector<AudioFrame>& frames, int sample_rate, const char* local_tag,
                      const char* remote_tag, TranscriptionResult& out);

    std::unique_ptr<ITranscriber> local_;
    std::unique_ptr<ITranscriber> remote_;
    RouterConfig config_;
    NullMetricsSink null_metrics_;
    IMetricsSink* metrics_;
};

}  // namespace voicegate

#endif  // VG_TRANSCRIPTION_ROUTER_H
