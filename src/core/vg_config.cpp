/**
 * @file vg_config.cpp
 * @brief VoiceGate - Configuration Loading and Validation
 */

#include "voicegate/core/vg_config.h"

#include <cctype>
#include <fstream>
#include <sstream>

static const char* LOG_CAT = "Config";

namespace voicegate {

namespace {

using Json = nlohmann::json;

vg_result_t invalid(const std::string& details) {
    VG_LOG_ERROR(LOG_CAT, "%s", details.c_str());
    vg_error_set_details(details.c_str());
    return VG_ERROR_CONFIG_INVALID;
}

// Copy j[key] into out when present. Type mismatch raises json::type_error.
template <typename T>
void read_field(const Json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

vg_result_t read_listener(const Json& j, ListenerConfig& out) {
    if (!j.is_object()) {
        return invalid("\"listener\" must be an object");
    }
    read_field(j, "sample_rate", out.sample_rate);
    read_field(j, "max_command_seconds", out.max_command_seconds);
    read_field(j, "silence_after_frames", out.silence_after_frames);
    read_field(j, "min_command_frames", out.min_command_frames);
    read_field(j, "min_speech_frames", out.min_speech_frames);
    read_field(j, "energy_threshold", out.energy_threshold);
    return VG_SUCCESS;
}

vg_result_t read_router(const Json& j, RouterConfig& out) {
    if (!j.is_object()) {
        return invalid("\"router\" must be an object");
    }
    read_field(j, "confidence_threshold", out.confidence_threshold);
    read_field(j, "stream_timeout_ms", out.stream_timeout_ms);
    return VG_SUCCESS;
}

}  // namespace

// =============================================================================
// BACKEND NAMES
// =============================================================================

const char* wake_backend_name(WakeBackend backend) {
    switch (backend) {
        case WakeBackend::Fallback:
            return "fallback";
        case WakeBackend::ExternalDetector:
            return "external-detector";
        default:
            return "unknown";
    }
}

const char* embedding_backend_name(EmbeddingBackend backend) {
    switch (backend) {
        case EmbeddingBackend::Hash:
            return "hash";
        case EmbeddingBackend::ExternalModel:
            return "external-model";
        default:
            return "unknown";
    }
}

bool parse_wake_backend(const std::string& name, WakeBackend& out) {
    if (name == "fallback") {
        out = WakeBackend::Fallback;
    } else if (name == "external-detector") {
        out = WakeBackend::ExternalDetector;
    } else {
        return false;
    }
    return true;
}

bool parse_embedding_backend(const std::string& name, EmbeddingBackend& out) {
    if (name == "hash") {
        out = EmbeddingBackend::Hash;
    } else if (name == "external-model") {
        out = EmbeddingBackend::ExternalModel;
    } else {
        return false;
    }
    return true;
}

// =============================================================================
// JSON
// =============================================================================

vg_result_t config_from_json(const nlohmann::json& j, VoiceGateConfig& out) {
    if (!j.is_object()) {
        return invalid("config root must be a JSON object");
    }

    try {
        read_field(j, "wake_word", out.wake_word);

        if (j.contains("wake_backend")) {
            const std::string name = j.at("wake_backend").get<std::string>();
            if (!parse_wake_backend(name, out.wake_backend)) {
                return invalid("unknown wake_backend: " + name);
            }
        }
        if (j.contains("embedding_backend")) {
            const std::string name = j.at("embedding_backend").get<std::string>();
            if (!parse_embedding_backend(name, out.embedding_backend)) {
                return invalid("unknown embedding_backend: " + name);
            }
        }
        read_field(j, "embedding_length", out.embedding_length);

        auto endpoint = j.find("remote_endpoint");
        if (endpoint != j.end()) {
            if (endpoint->is_null()) {
                out.remote_endpoint.reset();
            } else {
                out.remote_endpoint = endpoint->get<std::string>();
            }
        }
        read_field(j, "remote_timeout_ms", out.remote_timeout_ms);

        read_field(j, "voiceprint_path", out.voiceprint_path);
        read_field(j, "voice_key_env", out.voice_key_env);
        read_field(j, "verify_threshold", out.verify_threshold);

        if (j.contains("listener")) {
            vg_result_t rc = read_listener(j.at("listener"), out.listener);
            if (VG_FAILED(rc)) return rc;
        }
        if (j.contains("router")) {
            vg_result_t rc = read_router(j.at("router"), out.router);
            if (VG_FAILED(rc)) return rc;
        }

        if (j.contains("logging")) {
            const Json& logging = j.at("logging");
            if (!logging.is_object()) {
                return invalid("\"logging\" must be an object");
            }
            if (logging.contains("level")) {
                const std::string level = logging.at("level").get<std::string>();
                if (!parse_log_level(level, out.log_level)) {
                    return invalid("unknown logging.level: " + level);
                }
            }
            read_field(logging, "redact", out.log_redact);
        }
    } catch (const nlohmann::json::exception& e) {
        return invalid(std::string("config type error: ") + e.what());
    }

    return VG_SUCCESS;
}

nlohmann::json config_to_json(const VoiceGateConfig& config) {
    Json j;
    j["wake_word"] = config.wake_word;
    j["wake_backend"] = wake_backend_name(config.wake_backend);
    j["embedding_backend"] = embedding_backend_name(config.embedding_backend);
    j["embedding_length"] = config.embedding_length;
    j["remote_endpoint"] = config.remote_endpoint ? Json(*config.remote_endpoint) : Json(nullptr);
    j["remote_timeout_ms"] = config.remote_timeout_ms;
    j["voiceprint_path"] = config.voiceprint_path;
    j["voice_key_env"] = config.voice_key_env;
    j["verify_threshold"] = config.verify_threshold;
    j["listener"] = {{"sample_rate", config.listener.sample_rate},
                     {"max_command_seconds", config.listener.max_command_seconds},
                     {"silence_after_frames", config.listener.silence_after_frames},
                     {"min_command_frames", config.listener.min_command_frames},
                     {"min_speech_frames", config.listener.min_speech_frames},
                     {"energy_threshold", config.listener.energy_threshold}};
    j["router"] = {{"confidence_threshold", config.router.confidence_threshold},
                   {"stream_timeout_ms", config.router.stream_timeout_ms}};
    std::string level = log_level_name(config.log_level);
    for (auto& c : level) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    j["logging"] = {{"level", level}, {"redact", config.log_redact}};
    return j;
}

vg_result_t load_config_file(const std::string& path, VoiceGateConfig& out) {
    std::ifstream file(path);
    if (!file.is_open()) {
        VG_LOG_ERROR(LOG_CAT, "Cannot open config file: %s", path.c_str());
        vg_error_set_details(("cannot open config file: " + path).c_str());
        return VG_ERROR_FILE_READ_FAILED;
    }

    Json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return invalid(std::string("config parse error: ") + e.what());
    }

    VoiceGateConfig parsed = out;
    vg_result_t rc = config_from_json(j, parsed);
    if (VG_FAILED(rc)) {
        return rc;
    }
    rc = validate_config(parsed);
    if (VG_FAILED(rc)) {
        return rc;
    }

    out = parsed;
    VG_LOG_INFO(LOG_CAT, "Loaded config from %s", path.c_str());
    return VG_SUCCESS;
}

// =============================================================================
// VALIDATION
// =============================================================================

vg_result_t validate_config(const VoiceGateConfig& config) {
    if (config.verify_threshold < 0.0f || config.verify_threshold > 1.0f) {
        return invalid("verify_threshold must be within [0, 1]");
    }
    if (config.router.confidence_threshold < 0.0f || config.router.confidence_threshold > 1.0f) {
        return invalid("router.confidence_threshold must be within [0, 1]");
    }
    if (config.router.stream_timeout_ms < 0) {
        return invalid("router.stream_timeout_ms must be >= 0");
    }
    if (config.embedding_length <= 0) {
        return invalid("embedding_length must be > 0");
    }
    if (config.remote_timeout_ms <= 0) {
        return invalid("remote_timeout_ms must be > 0");
    }
    if (config.voiceprint_path.empty()) {
        return invalid("voiceprint_path must not be empty");
    }
    if (config.voice_key_env.empty()) {
        return invalid("voice_key_env must not be empty");
    }

    const ListenerConfig& l = config.listener;
    if (l.sample_rate <= 0) {
        return invalid("listener.sample_rate must be > 0");
    }
    if (!(l.max_command_seconds > 0.0) || l.max_command_seconds > kMaxCommandSecondsLimit) {
        return invalid("listener.max_command_seconds must be within (0, 3600]");
    }
    if (l.silence_after_frames <= 0) {
        return invalid("listener.silence_after_frames must be > 0");
    }
    if (l.min_command_frames < 0 || l.min_speech_frames < 0) {
        return invalid("listener guardrail frame counts must be >= 0");
    }
    if (l.energy_threshold < 0.0f) {
        return invalid("listener.energy_threshold must be >= 0");
    }

    if (config.remote_endpoint) {
        const std::string& url = *config.remote_endpoint;
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            return invalid("remote_endpoint must start with http:// or https://");
        }
    }

    return VG_SUCCESS;
}

void apply_logging_config(const VoiceGateConfig& config) {
    Logger::instance().setMinLevel(config.log_level);
    Logger::instance().setRedaction(config.log_redact);
}

}  // namespace voicegate
