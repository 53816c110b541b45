/**
 * @file vg_error.cpp
 * @brief VoiceGate - Result Code Helpers
 */

#include "voicegate/core/vg_error.h"

#include <string>

// =============================================================================
// THREAD-LOCAL STORAGE
// =============================================================================

namespace {

thread_local std::string g_last_details;

}  // namespace

extern "C" {

// =============================================================================
// ERROR INFORMATION
// =============================================================================

const char* vg_error_code_name(vg_result_t code) {
    switch (code) {
        case VG_SUCCESS: return "SUCCESS";
        case VG_ERROR_CONFIG_MISSING: return "CONFIG_MISSING";
        case VG_ERROR_CONFIG_INVALID: return "CONFIG_INVALID";
        case VG_ERROR_REMOTE_BACKEND: return "REMOTE_BACKEND";
        case VG_ERROR_VOICEPRINT_NOT_FOUND: return "VOICEPRINT_NOT_FOUND";
        case VG_ERROR_FILE_WRITE_FAILED: return "FILE_WRITE_FAILED";
        case VG_ERROR_FILE_READ_FAILED: return "FILE_READ_FAILED";
        case VG_ERROR_VOICEPRINT_CORRUPT: return "VOICEPRINT_CORRUPT";
        case VG_ERROR_INVALID_INPUT: return "INVALID_INPUT";
        case VG_ERROR_INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case VG_ERROR_SOURCE_CLOSED: return "SOURCE_CLOSED";
        case VG_ERROR_SPEECH_TOO_SHORT: return "SPEECH_TOO_SHORT";
        case VG_ERROR_ENROLLMENT_MISSING: return "ENROLLMENT_MISSING";
        case VG_ERROR_SPEAKER_MISMATCH: return "SPEAKER_MISMATCH";
        case VG_ERROR_CRYPTO_FAILED: return "CRYPTO_FAILED";
        case VG_ERROR_PROVIDER_NOT_FOUND: return "PROVIDER_NOT_FOUND";
        default: return "UNKNOWN_CODE";
    }
}

const char* vg_error_category(vg_result_t code) {
    if (code == VG_SUCCESS) return "Success";
    if (code >= -109 && code <= -100) return "Initialization";
    if (code >= -179 && code <= -150) return "Network";
    if (code >= -219 && code <= -180) return "Storage";
    if (code >= -279 && code <= -250) return "Validation";
    if (code >= -299 && code <= -280) return "Audio";
    if (code >= -329 && code <= -320) return "Authentication";
    if (code >= -349 && code <= -330) return "Security";
    if (code >= -499 && code <= -400) return "ModuleService";
    return "Unknown";
}

const char* vg_error_message(vg_result_t code) {
    switch (code) {
        case VG_SUCCESS:
            return "Success";
        case VG_ERROR_CONFIG_MISSING:
            return "Required configuration value is missing";
        case VG_ERROR_CONFIG_INVALID:
            return "Configuration value is invalid";
        case VG_ERROR_REMOTE_BACKEND:
            return "Remote transcription backend failed";
        case VG_ERROR_VOICEPRINT_NOT_FOUND:
            return "No voiceprint has been saved";
        case VG_ERROR_FILE_WRITE_FAILED:
            return "Failed to write file";
        case VG_ERROR_FILE_READ_FAILED:
            return "Failed to read file";
        case VG_ERROR_VOICEPRINT_CORRUPT:
            return "Stored voiceprint could not be decoded";
        case VG_ERROR_INVALID_INPUT:
            return "Invalid input";
        case VG_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case VG_ERROR_SOURCE_CLOSED:
            return "Audio source closed before wake word detected";
        case VG_ERROR_SPEECH_TOO_SHORT:
            return "Insufficient speech captured for verification";
        case VG_ERROR_ENROLLMENT_MISSING:
            return "Owner has not been enrolled";
        case VG_ERROR_SPEAKER_MISMATCH:
            return "Speaker does not match owner";
        case VG_ERROR_CRYPTO_FAILED:
            return "Cryptographic primitive failed";
        case VG_ERROR_PROVIDER_NOT_FOUND:
            return "No backend registered under the requested name";
        default:
            return "Unknown error";
    }
}

const char* vg_error_recovery_suggestion(vg_result_t code) {
    switch (code) {
        case VG_ERROR_CONFIG_MISSING:
            return "Set the voice key environment variable before starting.";
        case VG_ERROR_SOURCE_CLOSED:
            return "Reopen the audio source and listen again.";
        case VG_ERROR_SPEECH_TOO_SHORT:
            return "Speak the full command after the wake word.";
        case VG_ERROR_ENROLLMENT_MISSING:
            return "Enroll the owner voiceprint first.";
        case VG_ERROR_SPEAKER_MISMATCH:
            return "Ask the owner to repeat the command.";
        case VG_ERROR_REMOTE_BACKEND:
            return "Check the remote endpoint and network connection.";
        case VG_ERROR_PROVIDER_NOT_FOUND:
            return "Register the backend before creating components.";
        default:
            return nullptr;
    }
}

int vg_error_is_recoverable(vg_result_t code) {
    return (code == VG_ERROR_SPEECH_TOO_SHORT || code == VG_ERROR_SPEAKER_MISMATCH) ? 1 : 0;
}

// =============================================================================
// DETAILS
// =============================================================================

void vg_error_set_details(const char* details) {
    g_last_details = details ? details : "";
}

const char* vg_error_get_details(void) {
    return g_last_details.c_str();
}

void vg_error_clear_details(void) {
    g_last_details.clear();
}

}  // extern "C"
