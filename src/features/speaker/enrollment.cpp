/**
 * @file enrollment.cpp
 * @brief VoiceGate - Owner Enrollment From an Audio File
 */

#include "voicegate/features/speaker/vg_enrollment.h"

#include <memory>
#include <vector>

#include "voicegate/core/vg_logger.h"
#include "voicegate/features/listener/vg_frame_source.h"
#include "voicegate/features/speaker/vg_speaker_verifier.h"

static const char* LOG_CAT = "Verifier";

namespace voicegate {

vg_result_t enroll_from_file(const std::string& audio_path, const VoiceGateConfig& config,
                             EnrollmentSummary& out, size_t chunk_size) {
    vg_result_t rc = require_voice_key(config.voice_key_env);
    if (VG_FAILED(rc)) {
        return rc;
    }

    std::vector<AudioFrame> frames;
    rc = read_pcm_frames(audio_path, chunk_size, frames);
    if (VG_FAILED(rc)) {
        return rc;
    }

    std::unique_ptr<SpeakerVerifier> verifier;
    rc = SpeakerVerifier::from_config(config, verifier);
    if (VG_FAILED(rc)) {
        return rc;
    }

    Embedding embedding;
    rc = verifier->enroll_owner(frames, config.listener.sample_rate, embedding);
    if (VG_FAILED(rc)) {
        return rc;
    }

    out.voiceprint_path = config.voiceprint_path;
    out.frames = frames.size();
    out.embedding_length = embedding.size();

    VG_LOG_INFO(LOG_CAT, "Enrollment complete: %zu frames from %s", out.frames,
                audio_path.c_str());
    return VG_SUCCESS;
}

}  // namespace voicegate
