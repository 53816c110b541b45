/**
 * @file vg_config.h
 * @brief VoiceGate - Configuration
 *
 * All backend selection happens through an explicit VoiceGateConfig passed at
 * construction. The only value read from the environment is the voiceprint
 * secret, whose variable name is part of the config (voice_key_env).
 *
 * JSON layout (every key optional):
 *
 *   {
 *     "wake_word": "jarvis",
 *     "wake_backend": "fallback" | "external-detector",
 *     "embedding_backend": "hash" | "external-model",
 *     "embedding_length": 32,
 *     "remote_endpoint": "https://asr.example/v1/transcribe",
 *     "remote_timeout_ms": 10000,
 *     "voiceprint_path": "./owner.voiceprint",
 *     "voice_key_env": "VOICEGATE_VOICE_KEY",
 *     "verify_threshold": 0.8,
 *     "listener": { "sample_rate": 16000, "max_command_seconds": 15.0,
 *                   "silence_after_frames": 30, "min_command_frames": 2,
 *                   "min_speech_frames": 2, "energy_threshold": 50.0 },
 *     "router": { "confidence_threshold": 0.7, "stream_timeout_ms": 5000 },
 *     "logging": { "level": "debug", "redact": true }
 *   }
 */

#ifndef VG_CONFIG_H
#define VG_CONFIG_H

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_logger.h"

namespace voicegate {

enum class WakeBackend { Fallback, ExternalDetector };
enum class EmbeddingBackend { Hash, ExternalModel };

const char* wake_backend_name(WakeBackend backend);
const char* embedding_backend_name(EmbeddingBackend backend);
bool parse_wake_backend(const std::string& name, WakeBackend& out);
bool parse_embedding_backend(const std::string& name, EmbeddingBackend& out);

// Upper bound accepted by validate_config for listener.max_command_seconds
constexpr double kMaxCommandSecondsLimit = 3600.0;

struct ListenerConfig {
    int sample_rate = 16000;
    double max_command_seconds = 15.0;
    int silence_after_frames = 30;
    int min_command_frames = 2;
    int min_speech_frames = 2;
    float energy_threshold = 50.0f;
};

struct RouterConfig {
    float confidence_threshold = 0.7f;
    int stream_timeout_ms = 5000;
};

struct VoiceGateConfig {
    std::string wake_word = "jarvis";
    WakeBackend wake_backend = WakeBackend::Fallback;
    EmbeddingBackend embedding_backend = EmbeddingBackend::Hash;
    int embedding_length = 32;

    std::optional<std::string> remote_endpoint;
    int remote_timeout_ms = 10000;

    std::string voiceprint_path = "./owner.voiceprint";
    std::string voice_key_env = "VOICEGATE_VOICE_KEY";
    float verify_threshold = 0.8f;

    ListenerConfig listener;
    RouterConfig router;

    LogLevel log_level = LogLevel::Debug;
    bool log_redact = true;
};

/**
 * Overlay values from a JSON object onto out. Keys that are absent keep the
 * value already in out; unknown keys are ignored. Wrong types or unknown
 * backend names fail with VG_ERROR_CONFIG_INVALID (details set).
 */
vg_result_t config_from_json(const nlohmann::json& j, VoiceGateConfig& out);

nlohmann::json config_to_json(const VoiceGateConfig& config);

/**
 * Read and parse a JSON config file, then validate it.
 * Missing file -> VG_ERROR_FILE_READ_FAILED, bad JSON -> VG_ERROR_CONFIG_INVALID.
 */
vg_result_t load_config_file(const std::string& path, VoiceGateConfig& out);

/**
 * Range checks: thresholds in [0,1], positive rates/counts/timeouts,
 * non-empty paths, http(s) endpoint.
 */
vg_result_t validate_config(const VoiceGateConfig& config);

/**
 * Push log_level / log_redact into the process logger.
 */
void apply_logging_config(const VoiceGateConfig& config);

}  // namespace voicegate

#endif  // VG_CONFIG_H
