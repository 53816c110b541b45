/**
 * @file vg_transcriber.h
 * @brief VoiceGate - Transcription Backends
 *
 * The router only needs frames in, TranscriptionResult out. Local backends
 * are assumed always available; remote backends may fail with
 * VG_ERROR_REMOTE_BACKEND.
 */

#ifndef VG_TRANSCRIBER_H
#define VG_TRANSCRIBER_H

#include <memory>
#include <string>
#include <vector>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_types.h"

namespace voicegate {

class ITranscriber {
   public:
    virtual ~ITranscriber() = default;

    virtual vg_result_t transcribe(const std::vector<AudioFrame>& frames, int sample_rate,
                                   TranscriptionResult& out) = 0;
    virtual const char* name() const = 0;
};

/**
 * Concatenate frames, decode as lenient UTF-8 and trim ASCII whitespace.
 * Shared by the text placeholders below.
 */
std::string frames_to_text(const std::vector<AudioFrame>& frames);

// On-device placeholder. Confidence 0.65 for non-empty text, 0 otherwise.
class LocalTextTranscriber : public ITranscriber {
   public:
    static constexpr float kConfidence = 0.65f;

    vg_result_t transcribe(const std::vector<AudioFrame>& frames, int sample_rate,
                           TranscriptionResult& out) override;
    const char* name() const override { return "local_whisper"; }
};

// Remote placeholder used when no endpoint is configured. Confidence 0.85.
class CloudFallbackTranscriber : public ITranscriber {
   public:
    static constexpr float kConfidence = 0.85f;

    vg_result_t transcribe(const std::vector<AudioFrame>& frames, int sample_rate,
                           TranscriptionResult& out) override;
    const char* name() const override { return "cloud_fallback"; }
};

/**
 * Pick the remote tier:
 *   remote_endpoint set            -> HTTP backend ("remote_http")
 *   "remote" provider registered   -> that provider
 *   otherwise                      -> CloudFallbackTranscriber
 */
vg_result_t create_remote_transcriber(const VoiceGateConfig& config,
                                      std::unique_ptr<ITranscriber>& out);

}  // namespace voicegate

#endif  // VG_TRANSCRIBER_H
