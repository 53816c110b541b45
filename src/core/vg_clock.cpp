/**
 * @file vg_clock.cpp
 * @brief VoiceGate - Monotonic Time Helper Implementation
 */

#include "voicegate/core/vg_clock.h"

#include <chrono>

namespace voicegate {

namespace {

/**
 * Process-local epoch for monotonic timing.
 * Initialized on first call to monotonic_now_ms().
 */
class MonotonicEpoch {
   public:
    static MonotonicEpoch& instance() {
        static MonotonicEpoch epoch;
        return epoch;
    }

    double elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(now - epoch_).count();
        return static_cast<double>(us) / 1000.0;
    }

   private:
    MonotonicEpoch() : epoch_(std::chrono::steady_clock::now()) {}

    std::chrono::steady_clock::time_point epoch_;
};

}  // namespace

double monotonic_now_ms() {
    return MonotonicEpoch::instance().elapsed_ms();
}

int64_t wall_clock_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace voicegate
