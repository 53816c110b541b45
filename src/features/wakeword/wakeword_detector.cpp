/**
 * @file wakeword_detector.cpp
 * @brief VoiceGate - Wake Word Detection Implementation
 */

#include "voicegate/features/wakeword/vg_wakeword.h"

#include "voicegate/core/vg_logger.h"
#include "voicegate/infrastructure/registry/vg_backend_registry.h"
#include "voicegate/utils/vg_codec_utils.h"

static const char* LOG_CAT = "WakeWord";

namespace voicegate {

bool ClassifierWakeWordDetector::heard(const AudioFrame& frame) const {
    if (!classifier_) {
        return false;
    }
    return classifier_(frame);
}

TextWakeWordDetector::TextWakeWordDetector(const std::string& wake_word)
    : wake_word_(codec::to_lower_ascii(wake_word)) {}

bool TextWakeWordDetector::heard(const AudioFrame& frame) const {
    if (wake_word_.empty() || frame.empty()) {
        return false;
    }
    const std::string text =
        codec::to_lower_ascii(codec::decode_utf8_lenient(frame.data(), frame.size()));
    return text.find(wake_word_) != std::string::npos;
}

vg_result_t create_wake_word_detector(const VoiceGateConfig& config,
                                      std::unique_ptr<IWakeWordDetector>& out) {
    switch (config.wake_backend) {
        case WakeBackend::Fallback:
            out = std::make_unique<TextWakeWordDetector>(config.wake_word);
            VG_LOG_DEBUG(LOG_CAT, "Using text fallback detector for '%s'",
                         config.wake_word.c_str());
            return VG_SUCCESS;
        case WakeBackend::ExternalDetector:
            return BackendRegistry::instance().create_wake_detector(kExternalDetectorProvider,
                                                                    out);
    }
    vg_error_set_details("unknown wake backend");
    return VG_ERROR_CONFIG_INVALID;
}

}  // namespace voicegate
