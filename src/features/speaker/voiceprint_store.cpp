/**
 * @file voiceprint_store.cpp
 * @brief VoiceGate - Encrypted Voiceprint Persistence Implementation
 */

#include "voicegate/features/speaker/vg_voiceprint_store.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

#include <sys/stat.h>

#include "voicegate/core/vg_logger.h"

static const char* LOG_CAT = "VoiceprintStore";

namespace voicegate {

namespace {

// Shortest %g form that parses back to exactly the same float
std::string format_float(float value) {
    char buf[32];
    for (int precision = 6; precision <= 9; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, static_cast<double>(value));
        if (std::strtof(buf, nullptr) == value) {
            break;
        }
    }
    return buf;
}

bool parse_float(const std::string& text, float& out) {
    const char* begin = text.c_str();
    char* end = nullptr;
    const float value = std::strtof(begin, &end);
    if (end == begin || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

}  // namespace

// =============================================================================
// CONSTRUCTION
// =============================================================================

vg_result_t require_voice_key(const std::string& key_env_var) {
    const char* value = std::getenv(key_env_var.c_str());
    if (value == nullptr || value[0] == '\0') {
        const std::string details = "missing voiceprint key env var: " + key_env_var;
        VG_LOG_ERROR(LOG_CAT, "%s", details.c_str());
        vg_error_set_details(details.c_str());
        return VG_ERROR_CONFIG_MISSING;
    }
    return VG_SUCCESS;
}

FileVoiceprintStore::FileVoiceprintStore(PrivateTag, std::string path,
                                         const codec::Sha256Digest& key)
    : path_(std::move(path)), key_(key) {}

vg_result_t FileVoiceprintStore::create(const std::string& path, const std::string& key_env_var,
                                        std::unique_ptr<FileVoiceprintStore>& out) {
    vg_result_t rc = require_voice_key(key_env_var);
    if (VG_FAILED(rc)) {
        return rc;
    }
    return create_with_secret(path, std::getenv(key_env_var.c_str()), out);
}

vg_result_t FileVoiceprintStore::create_with_secret(const std::string& path,
                                                    const std::string& secret,
                                                    std::unique_ptr<FileVoiceprintStore>& out) {
    if (secret.empty()) {
        vg_error_set_details("voiceprint secret must not be empty");
        return VG_ERROR_CONFIG_MISSING;
    }
    if (path.empty()) {
        vg_error_set_details("voiceprint path must not be empty");
        return VG_ERROR_INVALID_ARGUMENT;
    }

    codec::Sha256Digest key{};
    vg_result_t rc =
        codec::sha256(reinterpret_cast<const uint8_t*>(secret.data()), secret.size(), key);
    if (VG_FAILED(rc)) {
        return rc;
    }

    out = std::make_unique<FileVoiceprintStore>(PrivateTag{}, path, key);
    return VG_SUCCESS;
}

vg_result_t FileVoiceprintStore::from_config(const VoiceGateConfig& config,
                                             std::unique_ptr<FileVoiceprintStore>& out) {
    return create(config.voiceprint_path, config.voice_key_env, out);
}

// =============================================================================
// ENCODE / DECODE
// =============================================================================

std::string FileVoiceprintStore::encode(const Embedding& embedding) const {
    std::string raw;
    for (size_t i = 0; i < embedding.size(); ++i) {
        if (i > 0) {
            raw.push_back(',');
        }
        raw += format_float(embedding[i]);
    }
    const std::vector<uint8_t> plain(raw.begin(), raw.end());
    return codec::base64_encode(codec::xor_with_key(plain, key_.data(), key_.size()));
}

vg_result_t FileVoiceprintStore::decode(const std::string& payload, Embedding& out) const {
    std::vector<uint8_t> cipher;
    if (VG_FAILED(codec::base64_decode(payload, cipher))) {
        vg_error_set_details("voiceprint is not valid base64");
        return VG_ERROR_VOICEPRINT_CORRUPT;
    }
    const std::vector<uint8_t> plain = codec::xor_with_key(cipher, key_.data(), key_.size());

    Embedding values;
    std::string field;
    std::istringstream stream(std::string(plain.begin(), plain.end()));
    while (std::getline(stream, field, ',')) {
        if (field.empty()) {
            continue;
        }
        float value = 0.0f;
        if (!parse_float(field, value)) {
            // Wrong key or tampered file
            vg_error_set_details("voiceprint does not decode to numbers (wrong key?)");
            return VG_ERROR_VOICEPRINT_CORRUPT;
        }
        values.push_back(value);
    }

    out = std::move(values);
    return VG_SUCCESS;
}

// =============================================================================
// FILE I/O
// =============================================================================

vg_result_t FileVoiceprintStore::save(const Embedding& embedding) {
    const std::string payload = encode(embedding);
    const std::string tmp_path = path_ + ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            VG_LOG_ERROR(LOG_CAT, "Cannot open %s for writing", tmp_path.c_str());
            vg_error_set_details(("cannot write " + tmp_path).c_str());
            return VG_ERROR_FILE_WRITE_FAILED;
        }
        file << payload;
        file.flush();
        if (!file) {
            std::remove(tmp_path.c_str());
            vg_error_set_details(("short write to " + tmp_path).c_str());
            return VG_ERROR_FILE_WRITE_FAILED;
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        VG_LOG_ERROR(LOG_CAT, "rename %s -> %s failed: %s", tmp_path.c_str(), path_.c_str(),
                     std::strerror(errno));
        std::remove(tmp_path.c_str());
        vg_error_set_details(("cannot replace " + path_).c_str());
        return VG_ERROR_FILE_WRITE_FAILED;
    }

    VG_LOG_INFO(LOG_CAT, "Stored %zu-dim voiceprint at %s", embedding.size(), path_.c_str());
    return VG_SUCCESS;
}

vg_result_t FileVoiceprintStore::load(Embedding& out) const {
    if (!exists()) {
        vg_error_set_details(("no voiceprint at " + path_).c_str());
        return VG_ERROR_VOICEPRINT_NOT_FOUND;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        vg_error_set_details(("cannot read " + path_).c_str());
        return VG_ERROR_FILE_READ_FAILED;
    }
    const std::string payload((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());

    return decode(payload, out);
}

bool FileVoiceprintStore::exists() const {
    struct stat st;
    return ::stat(path_.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

}  // namespace voicegate
