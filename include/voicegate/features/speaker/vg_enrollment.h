/**
 * @file vg_enrollment.h
 * @brief VoiceGate - Owner Enrollment From an Audio File
 */

#ifndef VG_ENROLLMENT_H
#define VG_ENROLLMENT_H

#include <cstddef>
#include <string>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"

namespace voicegate {

constexpr size_t kDefaultEnrollChunkSize = 1024;

struct EnrollmentSummary {
    std::string voiceprint_path;
    size_t frames = 0;
    size_t embedding_length = 0;
};

/**
 * Read a raw PCM file in chunk_size pieces and enroll the owner with the
 * configured embedding backend, storing at config.voiceprint_path.
 *
 * The secret is checked before the file is touched (VG_ERROR_CONFIG_MISSING).
 * An unreadable file gives VG_ERROR_FILE_READ_FAILED, an empty one
 * VG_ERROR_INVALID_INPUT.
 */
vg_result_t enroll_from_file(const std::string& audio_path, const VoiceGateConfig& config,
                             EnrollmentSummary& out,
                             size_t chunk_size = kDefaultEnrollChunkSize);

}  // namespace voicegate

#endif  // VG_ENROLLMENT_H
