/**
 * @file vg_speaker_verifier.h
 * @brief VoiceGate - Speaker Verification
 *
 * Ties an embedding model to a voiceprint store:
 *   enroll_owner  embeds the frames and overwrites the stored profile
 *   verify_owner  embeds the frames and scores them against the profile
 */

#ifndef VG_SPEAKER_VERIFIER_H
#define VG_SPEAKER_VERIFIER_H

#include <memory>
#include <vector>

#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_types.h"
#include "voicegate/features/speaker/vg_embedding.h"
#include "voicegate/features/speaker/vg_voiceprint_store.h"

namespace voicegate {

class SpeakerVerifier {
   public:
    static constexpr float kDefaultThreshold = 0.8f;

    SpeakerVerifier(std::unique_ptr<IEmbeddingModel> model,
                    std::unique_ptr<IVoiceprintStore> store,
                    float threshold = kDefaultThreshold);

    /**
     * Build the model and the file store from config. Fails eagerly with
     * VG_ERROR_CONFIG_MISSING when the voiceprint secret is not set.
     */
    static vg_result_t from_config(const VoiceGateConfig& config,
                                   std::unique_ptr<SpeakerVerifier>& out);

    vg_result_t enroll_owner(const std::vector<AudioFrame>& frames, int sample_rate,
                             Embedding& out_embedding);

    /**
     * VG_ERROR_ENROLLMENT_MISSING  no voiceprint stored
     * VG_ERROR_INVALID_INPUT       stored and candidate lengths differ
     * VG_ERROR_SPEAKER_MISMATCH    similarity < threshold (out_similarity still set)
     */
    vg_result_t verify_owner(const std::vector<AudioFrame>& frames, int sample_rate,
                             float& out_similarity);

    float threshold() const { return threshold_; }
    bool is_enrolled() const { return store_->exists(); }

   private:
    std::unique_ptr<IEmbeddingModel> model_;
    std::unique_ptr<IVoiceprintStore> store_;
    float threshold_;
};

}  // namespace voicegate

#endif  // VG_SPEAKER_VERIFIER_H
