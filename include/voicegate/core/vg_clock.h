/**
 * @file vg_clock.h
 * @brief VoiceGate - Monotonic Time Helper
 *
 * Latency numbers (wake-to-verify, transcription) are measured against
 * std::chrono::steady_clock so system clock adjustments never skew them.
 */

#ifndef VG_CLOCK_H
#define VG_CLOCK_H

#include <cstdint>

namespace voicegate {

/**
 * Milliseconds since a process-local epoch, with sub-millisecond precision.
 * Never decreases.
 */
double monotonic_now_ms();

/**
 * Wall-clock milliseconds since the Unix epoch. Used only for "last updated"
 * stamps, never for durations.
 */
int64_t wall_clock_now_ms();

}  // namespace voicegate

#endif  // VG_CLOCK_H
