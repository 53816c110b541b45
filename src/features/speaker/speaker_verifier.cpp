/**
 * @file speaker_verifier.cpp
 * @brief VoiceGate - Speaker Verification Implementation
 */

#include "voicegate/features/speaker/vg_speaker_verifier.h"

#include "voicegate/core/vg_logger.h"

static const char* LOG_CAT = "Verifier";

namespace voicegate {

SpeakerVerifier::SpeakerVerifier(std::unique_ptr<IEmbeddingModel> model,
                                 std::unique_ptr<IVoiceprintStore> store, float threshold)
    : model_(std::move(model)), store_(std::move(store)), threshold_(threshold) {}

vg_result_t SpeakerVerifier::from_config(const VoiceGateConfig& config,
                                         std::unique_ptr<SpeakerVerifier>& out) {
    std::unique_ptr<FileVoiceprintStore> store;
    vg_result_t rc = FileVoiceprintStore::from_config(config, store);
    if (VG_FAILED(rc)) {
        return rc;
    }

    std::unique_ptr<IEmbeddingModel> model;
    rc = create_embedding_model(config, model);
    if (VG_FAILED(rc)) {
        return rc;
    }

    out = std::make_unique<SpeakerVerifier>(std::move(model), std::move(store),
                                            config.verify_threshold);
    return VG_SUCCESS;
}

vg_result_t SpeakerVerifier::enroll_owner(const std::vector<AudioFrame>& frames, int sample_rate,
                                          Embedding& out_embedding) {
    Embedding embedding;
    vg_result_t rc = model_->embed(frames, sample_rate, embedding);
    if (VG_FAILED(rc)) {
        return rc;
    }

    rc = store_->save(embedding);
    if (VG_FAILED(rc)) {
        return rc;
    }

    VG_LOG_INFO(LOG_CAT, "Owner enrolled from %zu frames (%s, dim=%zu)", frames.size(),
                model_->name(), embedding.size());
    out_embedding = std::move(embedding);
    return VG_SUCCESS;
}

vg_result_t SpeakerVerifier::verify_owner(const std::vector<AudioFrame>& frames, int sample_rate,
                                          float& out_similarity) {
    if (!store_->exists()) {
        VG_LOG_WARNING(LOG_CAT, "Verification requested before enrollment");
        vg_error_set_details("owner has not been enrolled");
        return VG_ERROR_ENROLLMENT_MISSING;
    }

    Embedding owner;
    vg_result_t rc = store_->load(owner);
    if (VG_FAILED(rc)) {
        return rc;
    }

    Embedding candidate;
    rc = model_->embed(frames, sample_rate, candidate);
    if (VG_FAILED(rc)) {
        return rc;
    }

    float similarity = 0.0f;
    rc = cosine_similarity(owner, candidate, similarity);
    if (VG_FAILED(rc)) {
        return rc;
    }
    out_similarity = similarity;

    if (similarity < threshold_) {
        VG_LOG_INFO(LOG_CAT, "Speaker mismatch: similarity %.3f < %.3f", similarity, threshold_);
        vg_error_set_details("speaker does not match owner");
        return VG_ERROR_SPEAKER_MISMATCH;
    }

    VG_LOG_DEBUG(LOG_CAT, "Speaker verified: similarity %.3f", similarity);
    return VG_SUCCESS;
}

}  // namespace voicegate
