/**
 * @file embedding_model.cpp
 * @brief VoiceGate - Speaker Embedding Models Implementation
 */

#include "voicegate/features/speaker/vg_embedding.h"

#include <algorithm>
#include <cmath>

#include "voicegate/core/vg_logger.h"
#include "voicegate/infrastructure/registry/vg_backend_registry.h"
#include "voicegate/utils/vg_codec_utils.h"

static const char* LOG_CAT = "Verifier";

namespace voicegate {

HashEmbeddingModel::HashEmbeddingModel(int length)
    : length_(static_cast<size_t>(std::clamp(length, 1, static_cast<int>(kMaxLength)))) {}

vg_result_t HashEmbeddingModel::embed(const std::vector<AudioFrame>& frames, int /*sample_rate*/,
                                      Embedding& out) {
    std::vector<double> acc(length_, 0.0);

    codec::Sha256Digest digest{};
    for (const auto& frame : frames) {
        vg_result_t rc = codec::sha256(frame.data(), frame.size(), digest);
        if (VG_FAILED(rc)) {
            return rc;
        }
        for (size_t i = 0; i < length_; ++i) {
            acc[i] += static_cast<double>(digest[i]);
        }
    }

    out.assign(length_, 0.0f);
    if (frames.empty()) {
        return VG_SUCCESS;
    }
    const double n = static_cast<double>(frames.size());
    for (size_t i = 0; i < length_; ++i) {
        out[i] = static_cast<float>(acc[i] / n);
    }
    return VG_SUCCESS;
}

vg_result_t create_embedding_model(const VoiceGateConfig& config,
                                   std::unique_ptr<IEmbeddingModel>& out) {
    switch (config.embedding_backend) {
        case EmbeddingBackend::Hash:
            out = std::make_unique<HashEmbeddingModel>(config.embedding_length);
            return VG_SUCCESS;
        case EmbeddingBackend::ExternalModel:
            return BackendRegistry::instance().create_embedding_model(kExternalModelProvider,
                                                                      config, out);
    }
    vg_error_set_details("unknown embedding backend");
    return VG_ERROR_CONFIG_INVALID;
}

vg_result_t cosine_similarity(const Embedding& a, const Embedding& b, float& out) {
    if (a.size() != b.size()) {
        VG_LOG_ERROR(LOG_CAT, "Embedding length mismatch: %zu vs %zu", a.size(), b.size());
        vg_error_set_details("embeddings must have the same length");
        return VG_ERROR_INVALID_INPUT;
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        out = 0.0f;
        return VG_SUCCESS;
    }
    out = static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
    return VG_SUCCESS;
}

}  // namespace voicegate
