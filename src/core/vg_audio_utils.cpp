/**
 * @file vg_audio_utils.cpp
 * @brief VoiceGate - Frame Energy and Silence Classification
 */

#include "voicegate/core/vg_audio_utils.h"

#include <algorithm>
#include <cstdlib>

namespace voicegate {

bool decode_pcm16(const AudioFrame& frame, std::vector<int16_t>& out) {
    if (frame.empty() || (frame.size() % 2) != 0) {
        return false;
    }
    out.resize(frame.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const uint16_t lo = frame[2 * i];
        const uint16_t hi = frame[2 * i + 1];
        out[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
    }
    return true;
}

bool mean_abs_energy(const AudioFrame& frame, double& out_energy) {
    std::vector<int16_t> samples;
    if (!decode_pcm16(frame, samples)) {
        return false;
    }
    double acc = 0.0;
    for (int16_t s : samples) {
        acc += std::abs(static_cast<int32_t>(s));
    }
    out_energy = acc / static_cast<double>(samples.size());
    return true;
}

bool has_nonzero_byte(const AudioFrame& frame) {
    return std::any_of(frame.begin(), frame.end(), [](uint8_t b) { return b != 0; });
}

bool is_silent_frame(const AudioFrame& frame, float energy_threshold) {
    double energy = 0.0;
    if (mean_abs_energy(frame, energy)) {
        return energy < static_cast<double>(energy_threshold);
    }
    // Not PCM: fall back to the zero-byte heuristic
    return !has_nonzero_byte(frame);
}

size_t count_non_silent(const std::vector<AudioFrame>& frames, float energy_threshold) {
    return static_cast<size_t>(
        std::count_if(frames.begin(), frames.end(), [energy_threshold](const AudioFrame& f) {
            return !is_silent_frame(f, energy_threshold);
        }));
}

}  // namespace voicegate
