/**
 * @file vg_codec_utils.h
 * @brief VoiceGate - Encoding Helpers
 *
 * Base64, SHA-256 and the keyed XOR transform used by the voiceprint file
 * format, plus lenient UTF-8 text decoding of frames.
 */

#ifndef VG_CODEC_UTILS_H
#define VG_CODEC_UTILS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "voicegate/core/vg_error.h"

namespace voicegate {
namespace codec {

using Sha256Digest = std::array<uint8_t, 32>;

std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);

/**
 * Strict decode: whitespace is skipped, any other non-alphabet character or
 * a truncated quantum fails with VG_ERROR_INVALID_INPUT.
 */
vg_result_t base64_decode(const std::string& text, std::vector<uint8_t>& out);

vg_result_t sha256(const uint8_t* data, size_t len, Sha256Digest& out);

/**
 * XOR every byte with key[i % key.size()]. Applying it twice restores the input.
 * An empty key leaves the data unchanged.
 */
std::vector<uint8_t> xor_with_key(const std::vector<uint8_t>& data, const uint8_t* key,
                                  size_t key_len);

/**
 * Decode bytes as UTF-8, dropping invalid sequences.
 */
std::string decode_utf8_lenient(const uint8_t* data, size_t len);

std::string to_lower_ascii(std::string s);

}  // namespace codec
}  // namespace voicegate

#endif  // VG_CODEC_UTILS_H
