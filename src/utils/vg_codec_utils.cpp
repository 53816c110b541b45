/**
 * @file vg_codec_utils.cpp
 * @brief VoiceGate - Encoding Helpers Implementation
 */

#include "voicegate/utils/vg_codec_utils.h"

#include <algorithm>
#include <cctype>

#include "mbedtls/sha256.h"

#include "voicegate/core/vg_logger.h"

static const char* LOG_CAT = "Codec";

namespace voicegate {
namespace codec {

namespace {

const char kBase64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

// Length of a valid UTF-8 sequence starting at data[i], 0 if invalid
size_t utf8_sequence_length(const uint8_t* data, size_t len, size_t i) {
    const uint8_t lead = data[i];
    size_t need = 0;
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        need = 2;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        need = 3;
    } else {
        return 0;
    }
    if (i + need >= len) {
        return 0;
    }
    for (size_t k = 1; k <= need; ++k) {
        if ((data[i + k] & 0xC0) != 0x80) {
            return 0;
        }
    }
    // Reject overlong 3/4-byte forms and surrogates
    if (lead == 0xE0 && data[i + 1] < 0xA0) return 0;
    if (lead == 0xED && data[i + 1] > 0x9F) return 0;
    if (lead == 0xF0 && data[i + 1] < 0x90) return 0;
    if (lead == 0xF4 && data[i + 1] > 0x8F) return 0;
    return need + 1;
}

}  // namespace

// =============================================================================
// BASE64
// =============================================================================

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i < len) {
        size_t remaining = len - i;
        uint32_t octet_a = data[i++];
        uint32_t octet_b = remaining > 1 ? data[i++] : 0;
        uint32_t octet_c = remaining > 2 ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) | (octet_b << 8) | octet_c;

        out.push_back(kBase64Table[(triple >> 18) & 0x3F]);
        out.push_back(kBase64Table[(triple >> 12) & 0x3F]);
        out.push_back(remaining > 1 ? kBase64Table[(triple >> 6) & 0x3F] : '=');
        out.push_back(remaining > 2 ? kBase64Table[triple & 0x3F] : '=');
    }

    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

vg_result_t base64_decode(const std::string& text, std::vector<uint8_t>& out) {
    std::string input;
    input.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            input.push_back(c);
        }
    }

    out.clear();
    if (input.empty()) {
        return VG_SUCCESS;
    }
    if (input.size() % 4 != 0) {
        vg_error_set_details("base64 input length is not a multiple of 4");
        return VG_ERROR_INVALID_INPUT;
    }

    out.reserve((input.size() / 4) * 3);
    for (size_t i = 0; i < input.size(); i += 4) {
        const bool last = (i + 4 == input.size());
        int v[4];
        int padding = 0;
        for (int k = 0; k < 4; ++k) {
            const char c = input[i + k];
            if (c == '=' && last && k >= 2) {
                v[k] = 0;
                ++padding;
                continue;
            }
            if (padding > 0) {
                vg_error_set_details("base64 data after padding");
                return VG_ERROR_INVALID_INPUT;
            }
            v[k] = base64_value(static_cast<unsigned char>(c));
            if (v[k] < 0) {
                vg_error_set_details("invalid base64 character");
                return VG_ERROR_INVALID_INPUT;
            }
        }

        const uint32_t triple = (static_cast<uint32_t>(v[0]) << 18) |
                                (static_cast<uint32_t>(v[1]) << 12) |
                                (static_cast<uint32_t>(v[2]) << 6) | static_cast<uint32_t>(v[3]);
        out.push_back(static_cast<uint8_t>((triple >> 16) & 0xFF));
        if (padding < 2) out.push_back(static_cast<uint8_t>((triple >> 8) & 0xFF));
        if (padding < 1) out.push_back(static_cast<uint8_t>(triple & 0xFF));
    }
    return VG_SUCCESS;
}

// =============================================================================
// HASHING / XOR
// =============================================================================

vg_result_t sha256(const uint8_t* data, size_t len, Sha256Digest& out) {
    if (mbedtls_sha256(data, len, out.data(), 0) != 0) {
        VG_LOG_ERROR(LOG_CAT, "mbedtls_sha256 failed");
        vg_error_set_details("SHA-256 computation failed");
        return VG_ERROR_CRYPTO_FAILED;
    }
    return VG_SUCCESS;
}

std::vector<uint8_t> xor_with_key(const std::vector<uint8_t>& data, const uint8_t* key,
                                  size_t key_len) {
    std::vector<uint8_t> out(data);
    if (key == nullptr || key_len == 0) {
        return out;
    }
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] ^= key[i % key_len];
    }
    return out;
}

// =============================================================================
// TEXT
// =============================================================================

std::string decode_utf8_lenient(const uint8_t* data, size_t len) {
    std::string out;
    if (data == nullptr) {
        return out;
    }
    out.reserve(len);
    size_t i = 0;
    while (i < len) {
        const size_t n = utf8_sequence_length(data, len, i);
        if (n == 0) {
            ++i;
            continue;
        }
        out.append(reinterpret_cast<const char*>(data + i), n);
        i += n;
    }
    return out;
}

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return (c < 0x80) ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return s;
}

}  // namespace codec
}  // namespace voicegate
