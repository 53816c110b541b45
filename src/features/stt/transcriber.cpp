/**
 * @file transcriber.cpp
 * @brief VoiceGate - Transcription Backends Implementation
 */

#include "voicegate/features/stt/vg_transcriber.h"

#include "backends/remote/http_transcriber.h"
#include "voicegate/core/vg_logger.h"
#include "voicegate/infrastructure/registry/vg_backend_registry.h"
#include "voicegate/utils/vg_codec_utils.h"

static const char* LOG_CAT = "ASR";

namespace voicegate {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

}  // namespace

std::string frames_to_text(const std::vector<AudioFrame>& frames) {
    std::string text;
    for (const auto& frame : frames) {
        text += codec::decode_utf8_lenient(frame.data(), frame.size());
    }

    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

// Placeholder: a real deployment runs an on-device model here
vg_result_t LocalTextTranscriber::transcribe(const std::vector<AudioFrame>& frames,
                                             int /*sample_rate*/, TranscriptionResult& out) {
    out.text = frames_to_text(frames);
    out.confidence = out.text.empty() ? 0.0f : kConfidence;
    out.source = name();
    VG_LOG_DEBUG(LOG_CAT, "Local ASR produced %zu chars, confidence=%.2f", out.text.size(),
                 out.confidence);
    return VG_SUCCESS;
}

vg_result_t CloudFallbackTranscriber::transcribe(const std::vector<AudioFrame>& frames,
                                                 int /*sample_rate*/, TranscriptionResult& out) {
    out.text = frames_to_text(frames);
    out.confidence = out.text.empty() ? 0.0f : kConfidence;
    out.source = name();
    VG_LOG_DEBUG(LOG_CAT, "Cloud ASR produced %zu chars, confidence=%.2f", out.text.size(),
                 out.confidence);
    return VG_SUCCESS;
}

vg_result_t create_remote_transcriber(const VoiceGateConfig& config,
                                      std::unique_ptr<ITranscriber>& out) {
    if (config.remote_endpoint) {
        remote::Endpoint endpoint;
        if (!remote::parse_endpoint(*config.remote_endpoint, endpoint)) {
            vg_error_set_details("remote_endpoint must start with http:// or https://");
            return VG_ERROR_CONFIG_INVALID;
        }
        out = std::make_unique<remote::HttpRemoteTranscriber>(*config.remote_endpoint,
                                                              config.remote_timeout_ms);
        VG_LOG_INFO(LOG_CAT, "Remote ASR: %s", config.remote_endpoint->c_str());
        return VG_SUCCESS;
    }

    BackendRegistry& registry = BackendRegistry::instance();
    if (registry.has_provider(ProviderKind::RemoteTranscriber, kRemoteTranscriberProvider)) {
        return registry.create_remote_transcriber(kRemoteTranscriberProvider, config, out);
    }

    out = std::make_unique<CloudFallbackTranscriber>();
    return VG_SUCCESS;
}

}  // namespace voicegate
