/**
 * @file vg_wakeword.h
 * @brief VoiceGate - Wake Word Detection
 *
 * A detector answers one question per frame: was the trigger phrase heard?
 * Detection is frame-local and keeps no state between calls, so any backend
 * with the same heard(frame) contract can replace another without touching
 * the listener.
 */

#ifndef VG_WAKEWORD_H
#define VG_WAKEWORD_H

#include <functional>
#include <memory>
#include <string>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_types.h"

namespace voicegate {

// Opaque binary classifier supplied by an acoustic backend
using WakeClassifier = std::function<bool(const AudioFrame& frame)>;

class IWakeWordDetector {
   public:
    virtual ~IWakeWordDetector() = default;

    virtual bool heard(const AudioFrame& frame) const = 0;
    virtual const char* name() const = 0;
};

/**
 * Delegates every frame to a caller-supplied classifier.
 * An empty classifier never fires.
 */
class ClassifierWakeWordDetector : public IWakeWordDetector {
   public:
    explicit ClassifierWakeWordDetector(WakeClassifier classifier)
        : classifier_(std::move(classifier)) {}

    bool heard(const AudioFrame& frame) const override;
    const char* name() const override { return "external-detector"; }

   private:
    WakeClassifier classifier_;
};

/**
 * Fallback detector: the frame is decoded as UTF-8 text (invalid bytes
 * dropped), lower-cased and searched for the lower-cased wake word.
 */
class TextWakeWordDetector : public IWakeWordDetector {
   public:
    explicit TextWakeWordDetector(const std::string& wake_word);

    bool heard(const AudioFrame& frame) const override;
    const char* name() const override { return "fallback"; }

    const std::string& wake_word() const { return wake_word_; }

   private:
    std::string wake_word_;
};

/**
 * Build the detector selected by config.wake_backend. "external-detector"
 * resolves through BackendRegistry and fails with VG_ERROR_PROVIDER_NOT_FOUND
 * when nothing is registered.
 */
vg_result_t create_wake_word_detector(const VoiceGateConfig& config,
                                      std::unique_ptr<IWakeWordDetector>& out);

}  // namespace voicegate

#endif  // VG_WAKEWORD_H
