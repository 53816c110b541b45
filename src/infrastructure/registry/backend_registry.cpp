/**
 * @file backend_registry.cpp
 * @brief VoiceGate - Backend Registry Implementation
 */

#include "voicegate/infrastructure/registry/vg_backend_registry.h"

#include "voicegate/core/vg_logger.h"

static const char* LOG_CAT = "Registry";

namespace voicegate {

namespace {

vg_result_t not_found(ProviderKind kind, const std::string& name) {
    const std::string details =
        std::string("no ") + provider_kind_name(kind) + " provider registered as '" + name + "'";
    vg_error_set_details(details.c_str());
    VG_LOG_WARNING(LOG_CAT, "%s", details.c_str());
    return VG_ERROR_PROVIDER_NOT_FOUND;
}

vg_result_t rejected(const char* what) {
    vg_error_set_details(what);
    return VG_ERROR_INVALID_ARGUMENT;
}

template <typename Map>
std::vector<std::string> keys_of(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& entry : map) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace

const char* provider_kind_name(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::Embedding:
            return "embedding";
        case ProviderKind::WakeDetector:
            return "wake-detector";
        case ProviderKind::RemoteTranscriber:
            return "remote-transcriber";
        default:
            return "unknown";
    }
}

BackendRegistry& BackendRegistry::instance() {
    static BackendRegistry registry;
    return registry;
}

// =============================================================================
// REGISTRATION
// =============================================================================

vg_result_t BackendRegistry::register_embedding_provider(const std::string& name,
                                                         EmbeddingFactory factory) {
    if (name.empty() || !factory) {
        return rejected("embedding provider needs a name and a factory");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    embedding_[name] = std::move(factory);
    VG_LOG_INFO(LOG_CAT, "Registered embedding provider: %s", name.c_str());
    return VG_SUCCESS;
}

vg_result_t BackendRegistry::register_wake_detector(const std::string& name,
                                                    WakeClassifier classifier) {
    if (name.empty() || !classifier) {
        return rejected("wake detector needs a name and a classifier");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    wake_[name] = std::move(classifier);
    VG_LOG_INFO(LOG_CAT, "Registered wake detector: %s", name.c_str());
    return VG_SUCCESS;
}

vg_result_t BackendRegistry::register_remote_transcriber(const std::string& name,
                                                         TranscriberFactory factory) {
    if (name.empty() || !factory) {
        return rejected("remote transcriber needs a name and a factory");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    remote_[name] = std::move(factory);
    VG_LOG_INFO(LOG_CAT, "Registered remote transcriber: %s", name.c_str());
    return VG_SUCCESS;
}

vg_result_t BackendRegistry::unregister(ProviderKind kind, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t erased = 0;
    switch (kind) {
        case ProviderKind::Embedding:
            erased = embedding_.erase(name);
            break;
        case ProviderKind::WakeDetector:
            erased = wake_.erase(name);
            break;
        case ProviderKind::RemoteTranscriber:
            erased = remote_.erase(name);
            break;
    }
    if (erased == 0) {
        return not_found(kind, name);
    }
    VG_LOG_DEBUG(LOG_CAT, "Unregistered %s provider: %s", provider_kind_name(kind), name.c_str());
    return VG_SUCCESS;
}

// =============================================================================
// LOOKUP
// =============================================================================

bool BackendRegistry::has_provider(ProviderKind kind, const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (kind) {
        case ProviderKind::Embedding:
            return embedding_.count(name) != 0;
        case ProviderKind::WakeDetector:
            return wake_.count(name) != 0;
        case ProviderKind::RemoteTranscriber:
            return remote_.count(name) != 0;
    }
    return false;
}

std::vector<std::string> BackendRegistry::list_providers(ProviderKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (kind) {
        case ProviderKind::Embedding:
            return keys_of(embedding_);
        case ProviderKind::WakeDetector:
            return keys_of(wake_);
        case ProviderKind::RemoteTranscriber:
            return keys_of(remote_);
    }
    return {};
}

vg_result_t BackendRegistry::create_embedding_model(const std::string& name,
                                                    const VoiceGateConfig& config,
                                                    std::unique_ptr<IEmbeddingModel>& out) const {
    EmbeddingFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = embedding_.find(name);
        if (it == embedding_.end()) {
            return not_found(ProviderKind::Embedding, name);
        }
        factory = it->second;
    }

    // Factories run outside the lock so they may call back into the registry
    std::unique_ptr<IEmbeddingModel> model = factory(config);
    if (!model) {
        return not_found(ProviderKind::Embedding, name);
    }
    VG_LOG_DEBUG(LOG_CAT, "Embedding model created by provider: %s", name.c_str());
    out = std::move(model);
    return VG_SUCCESS;
}

vg_result_t BackendRegistry::create_wake_detector(const std::string& name,
                                                  std::unique_ptr<IWakeWordDetector>& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = wake_.find(name);
    if (it == wake_.end()) {
        return not_found(ProviderKind::WakeDetector, name);
    }
    out = std::make_unique<ClassifierWakeWordDetector>(it->second);
    return VG_SUCCESS;
}

vg_result_t BackendRegistry::create_remote_transcriber(const std::string& name,
                                                       const VoiceGateConfig& config,
                                                       std::unique_ptr<ITranscriber>& out) const {
    TranscriberFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = remote_.find(name);
        if (it == remote_.end()) {
            return not_found(ProviderKind::RemoteTranscriber, name);
        }
        factory = it->second;
    }

    std::unique_ptr<ITranscriber> transcriber = factory(config);
    if (!transcriber) {
        return not_found(ProviderKind::RemoteTranscriber, name);
    }
    VG_LOG_DEBUG(LOG_CAT, "Remote transcriber created by provider: %s", name.c_str());
    out = std::move(transcriber);
    return VG_SUCCESS;
}

void BackendRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    embedding_.clear();
    wake_.clear();
    remote_.clear();
}

}  // namespace voicegate
