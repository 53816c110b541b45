/**
 * @file vg_error.h
 * @brief VoiceGate - Result Codes and Error Helpers
 *
 * Every fallible VoiceGate operation returns a vg_result_t. Zero is success,
 * negative values are errors grouped into category ranges so callers can
 * branch on the range without knowing every individual code.
 *
 * A thread-local detail string accompanies the last failure on the calling
 * thread (vg_error_get_details) for logging or user-facing remediation.
 */

#ifndef VG_ERROR_H
#define VG_ERROR_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef int32_t vg_result_t;

#define VG_SUCCESS ((vg_result_t)0)

// Initialization (-100 .. -109)
#define VG_ERROR_CONFIG_MISSING ((vg_result_t)-100)
#define VG_ERROR_CONFIG_INVALID ((vg_result_t)-101)

// Network (-150 .. -179)
#define VG_ERROR_REMOTE_BACKEND ((vg_result_t)-150)

// Storage (-180 .. -219)
#define VG_ERROR_VOICEPRINT_NOT_FOUND ((vg_result_t)-180)
#define VG_ERROR_FILE_WRITE_FAILED ((vg_result_t)-181)
#define VG_ERROR_FILE_READ_FAILED ((vg_result_t)-182)
#define VG_ERROR_VOICEPRINT_CORRUPT ((vg_result_t)-183)

// Validation (-250 .. -279)
#define VG_ERROR_INVALID_INPUT ((vg_result_t)-250)
#define VG_ERROR_INVALID_ARGUMENT ((vg_result_t)-251)

// Audio (-280 .. -299)
#define VG_ERROR_SOURCE_CLOSED ((vg_result_t)-280)
#define VG_ERROR_SPEECH_TOO_SHORT ((vg_result_t)-281)

// Authentication (-320 .. -329)
#define VG_ERROR_ENROLLMENT_MISSING ((vg_result_t)-320)
#define VG_ERROR_SPEAKER_MISMATCH ((vg_result_t)-321)

// Security (-330 .. -349)
#define VG_ERROR_CRYPTO_FAILED ((vg_result_t)-330)

// ModuleService (-400 .. -499)
#define VG_ERROR_PROVIDER_NOT_FOUND ((vg_result_t)-400)

#define VG_SUCCEEDED(rc) ((rc) >= 0)
#define VG_FAILED(rc) ((rc) < 0)

/**
 * @brief Stable upper-case name for a code, e.g. "SPEAKER_MISMATCH"
 */
const char* vg_error_code_name(vg_result_t code);

/**
 * @brief Category derived from the code range, e.g. "Authentication"
 */
const char* vg_error_category(vg_result_t code);

/**
 * @brief Human-readable message for a code
 */
const char* vg_error_message(vg_result_t code);

/**
 * @brief Suggested remediation, or NULL when there is nothing useful to say
 */
const char* vg_error_recovery_suggestion(vg_result_t code);

/**
 * @brief Whether the caller may simply retry the same operation
 *
 * True for SPEECH_TOO_SHORT (re-listen) and SPEAKER_MISMATCH (re-prompt).
 */
int vg_error_is_recoverable(vg_result_t code);

/**
 * @brief Attach a detail string to the last error on this thread
 */
void vg_error_set_details(const char* details);

/**
 * @brief Detail string of the last error on this thread ("" if none)
 */
const char* vg_error_get_details(void);

/**
 * @brief Clear the detail string on this thread
 */
void vg_error_clear_details(void);

#ifdef __cplusplus
}
#endif

#endif  // VG_ERROR_H
