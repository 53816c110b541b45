/**
 * @file vg_voiceprint_store.h
 * @brief VoiceGate - Encrypted Voiceprint Persistence
 *
 * File format (text, one line, no trailing newline):
 *
 *   base64( xor( "f0,f1,...,fn", SHA-256(secret) ) )
 *
 * Each float is written with the shortest %g precision that reads back to
 * the same value. The XOR key repeats every 32 bytes. Empty fields are
 * skipped on load.
 *
 * NOTE: the keyed XOR is an obfuscation placeholder, not authenticated
 * encryption. Anyone holding the secret (or a known plaintext) can read or
 * forge the file.
 */

#ifndef VG_VOICEPRINT_STORE_H
#define VG_VOICEPRINT_STORE_H

#include <memory>
#include <string>

#include "voicegate/core/vg_config.h"
#include "voicegate/core/vg_error.h"
#include "voicegate/core/vg_types.h"
#include "voicegate/utils/vg_codec_utils.h"

namespace voicegate {

class IVoiceprintStore {
   public:
    virtual ~IVoiceprintStore() = default;

    // Persist, replacing any previous voiceprint
    virtual vg_result_t save(const Embedding& embedding) = 0;

    // VG_ERROR_VOICEPRINT_NOT_FOUND if nothing was ever saved
    virtual vg_result_t load(Embedding& out) const = 0;

    virtual bool exists() const = 0;
};

class FileVoiceprintStore : public IVoiceprintStore {
    struct PrivateTag {};

   public:
    // Requires PrivateTag; construct through create()
    FileVoiceprintStore(PrivateTag, std::string path, const codec::Sha256Digest& key);

    /**
     * Resolve the secret from the environment variable key_env_var.
     * An unset or empty variable fails here with VG_ERROR_CONFIG_MISSING,
     * before any save or load is attempted.
     */
    static vg_result_t create(const std::string& path, const std::string& key_env_var,
                              std::unique_ptr<FileVoiceprintStore>& out);

    // Same as create() with the secret passed directly.
    static vg_result_t create_with_secret(const std::string& path, const std::string& secret,
                                          std::unique_ptr<FileVoiceprintStore>& out);

    // Uses config.voiceprint_path and config.voice_key_env
    static vg_result_t from_config(const VoiceGateConfig& config,
                                   std::unique_ptr<FileVoiceprintStore>& out);

    vg_result_t save(const Embedding& embedding) override;
    vg_result_t load(Embedding& out) const override;
    bool exists() const override;

    const std::string& path() const { return path_; }

    // Encode/decode without touching the file
    std::string encode(const Embedding& embedding) const;
    vg_result_t decode(const std::string& payload, Embedding& out) const;

   private:
    std::string path_;
    codec::Sha256Digest key_;
};

/**
 * Fail with VG_ERROR_CONFIG_MISSING unless key_env_var names a non-empty
 * environment variable.
 */
vg_result_t require_voice_key(const std::string& key_env_var);

}  // namespace voicegate

#endif  // VG_VOICEPRINT_STORE_H
