/**
 * @file vg_backend_registry.h
 * @brief VoiceGate - Backend Registry
 *
 * Real acoustic backends (speaker models, wake detectors, remote ASR) live
 * outside this library. They register a factory here under a name, and the
 * config-driven factories resolve "external-model" / "external-detector" /
 * "remote" through it.
 *
 * Registration replaces any entry with the same name. Thread-safe.
 */

#ifndef VG_BACKEND_REGISTRY_H
#define VG_BACKEND_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"
#include "voicegate/features/speaker/vg_embedding.h"
#include "voicegate/features/stt/vg_transcriber.h"
#include "voicegate/features/wakeword/vg_wakeword.h"

namespace voicegate {

// Names the config-driven factories look up
constexpr const char* kExternalModelProvider = "external-model";
constexpr const char* kExternalDetectorProvider = "external-detector";
constexpr const char* kRemoteTranscriberProvider = "remote";

enum class ProviderKind { Embedding, WakeDetector, RemoteTranscriber };

const char* provider_kind_name(ProviderKind kind);

using EmbeddingFactory =
    std::function<std::unique_ptr<IEmbeddingModel>(const VoiceGateConfig& config)>;
using TranscriberFactory =
    std::function<std::unique_ptr<ITranscriber>(const VoiceGateConfig& config)>;

class BackendRegistry {
   public:
    static BackendRegistry& instance();

    vg_result_t register_embedding_provider(const std::string& name, EmbeddingFactory factory);
    vg_result_t register_wake_detector(const std::string& name, WakeClassifier classifier);
    vg_result_t register_remote_transcriber(const std::string& name, TranscriberFactory factory);

    // VG_ERROR_PROVIDER_NOT_FOUND if nothing is registered under name
    vg_result_t unregister(ProviderKind kind, const std::string& name);

    bool has_provider(ProviderKind kind, const std::string& name) const;
    std::vector<std::string> list_providers(ProviderKind kind) const;

    vg_result_t create_embedding_model(const std::string& name, const VoiceGateConfig& config,
                                       std::unique_ptr<IEmbeddingModel>& out) const;
    vg_result_t create_wake_detector(const std::string& name,
                                     std::unique_ptr<IWakeWordDetector>& out) const;
    vg_result_t create_remote_transcriber(const std::string& name, const VoiceGateConfig& config,
                                          std::unique_ptr<ITranscriber>& out) const;

    // Drop every registration (tests)
    void reset();

   private:
    BackendRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, EmbeddingFactory> embedding_;
    std::map<std::string, WakeClassifier> wake_;
    std::map<std::string, TranscriberFactory> remote_;
};

}  // namespace voicegate

#endif  // VG_BACKEND_REGISTRY_H
