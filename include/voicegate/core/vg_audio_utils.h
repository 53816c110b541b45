/**
 * @file vg_audio_utils.h
 * @brief VoiceGate - Frame Energy and Silence Classification
 *
 * Canonical silence rule used by capture and guardrails:
 *
 *   A frame with an even, non-zero byte length is read as little-endian
 *   signed 16-bit PCM. Its energy is mean(|sample|) over all samples and the
 *   frame is silent iff energy < energy_threshold.
 *
 *   A frame that cannot be read as PCM (empty or odd length) is silent iff
 *   every byte is zero.
 */

#ifndef VG_AUDIO_UTILS_H
#define VG_AUDIO_UTILS_H

#include <cstdint>
#include <vector>

#include "voicegate/core/vg_types.h"

namespace voicegate {

constexpr float kDefaultEnergyThreshold = 50.0f;

/**
 * Decode a frame as little-endian int16 PCM.
 * Returns false (out untouched) when the frame is empty or has an odd length.
 */
bool decode_pcm16(const AudioFrame& frame, std::vector<int16_t>& out);

/**
 * Mean absolute sample value. Returns false for frames that are not PCM.
 */
bool mean_abs_energy(const AudioFrame& frame, double& out_energy);

bool has_nonzero_byte(const AudioFrame& frame);

bool is_silent_frame(const AudioFrame& frame, float energy_threshold = kDefaultEnergyThreshold);

size_t count_non_silent(const std::vector<AudioFrame>& frames,
                        float energy_threshold = kDefaultEnergyThreshold);

}  // namespace voicegate

#endif  // VG_AUDIO_UTILS_H
