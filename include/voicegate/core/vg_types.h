/**
 * @file vg_types.h
 * @brief VoiceGate - Shared Data Types
 */

#ifndef VG_TYPES_H
#define VG_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace voicegate {

// One discrete chunk from an audio source. Duration is producer-defined.
using AudioFrame = std::vector<uint8_t>;

// Fixed-length speaker embedding. Length is backend-defined.
using Embedding = std::vector<float>;

/**
 * Captured audio that has passed speaker verification.
 * Immutable once constructed; the caller owns it.
 */
class VerifiedAudio {
   public:
    VerifiedAudio() = default;
    VerifiedAudio(std::vector<AudioFrame> frames, int sample_rate)
        : frames_(std::move(frames)), sample_rate_(sample_rate) {}

    const std::vector<AudioFrame>& frames() const { return frames_; }
    int sample_rate() const { return sample_rate_; }
    size_t frame_count() const { return frames_.size(); }
    bool empty() const { return frames_.empty(); }

   private:
    std::vector<AudioFrame> frames_;
    int sample_rate_ = 0;
};

struct TranscriptionResult {
    std::string text;
    float confidence = 0.0f;  // [0, 1]
    std::string source;       // backend tag, e.g. "local_whisper", "cloud_fallback_stream"
    std::optional<double> latency_ms;
};

/**
 * Build a frame from a string literal or text payload.
 */
inline AudioFrame make_frame(const std::string& bytes) {
    return AudioFrame(bytes.begin(), bytes.end());
}

}  // namespace voicegate

#endif  // VG_TYPES_H
