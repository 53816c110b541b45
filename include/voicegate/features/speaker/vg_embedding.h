/**
 * @file vg_embedding.h
 * @brief VoiceGate - Speaker Embedding Models
 */

#ifndef VG_EMBEDDING_H
#define VG_EMBEDDING_H

#include <memory>
#include <vector>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_types.h"

namespace voicegate {

class IEmbeddingModel {
   public:
    virtual ~IEmbeddingModel() = default;

    virtual vg_result_t embed(const std::vector<AudioFrame>& frames, int sample_rate,
                              Embedding& out) = 0;
    virtual size_t dimension() const = 0;
    virtual const char* name() const = 0;
};

/**
 * Deterministic stand-in for a speaker model.
 *
 * Each frame is hashed with SHA-256; the embedding is the per-position mean
 * of the first `length` digest bytes over all frames. No frames gives an
 * all-zero vector. length is clamped to [1, 32].
 */
class HashEmbeddingModel : public IEmbeddingModel {
   public:
    static constexpr size_t kMaxLength = 32;

    explicit HashEmbeddingModel(int length = 32);

    vg_result_t embed(const std::vector<AudioFrame>& frames, int sample_rate,
                      Embedding& out) override;
    size_t dimension() const override { return length_; }
    const char* name() const override { return "hash"; }

   private:
    size_t length_;
};

/**
 * Build the model selected by config.embedding_backend. "external-model"
 * resolves through BackendRegistry.
 */
vg_result_t create_embedding_model(const VoiceGateConfig& config,
                                   std::unique_ptr<IEmbeddingModel>& out);

/**
 * Cosine similarity dot(a,b) / (|a| * |b|).
 * Unequal lengths fail with VG_ERROR_INVALID_INPUT; a zero norm on either
 * side gives 0.0.
 */
vg_result_t cosine_similarity(const Embedding& a, const Embedding& b, float& out);

}  // namespace voicegate

#endif  // VG_EMBEDDING_H
