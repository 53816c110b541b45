/**
 * @file http_transcriber.h
 * @brief VoiceGate - HTTP Remote Transcription Backend
 *
 * Request  (POST, application/json):
 *   { "sample_rate": 16000, "frames": 12, "audio_base64": "<concatenated frames>" }
 *
 * Response (2xx):
 *   { "text": "...", "confidence": 0.93 }
 *
 * Anything else (transport error, non-2xx, malformed body) is
 * VG_ERROR_REMOTE_BACKEND. https:// endpoints need cpp-httplib built with
 * OpenSSL support.
 */

#ifndef VG_HTTP_TRANSCRIBER_H
#define VG_HTTP_TRANSCRIBER_H

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "voicegate/features/stt/vg_transcriber.h"

namespace voicegate {
namespace remote {

struct Endpoint {
    std::string base;  // scheme://host[:port]
    std::string path;  // "/..." (defaults to "/")
};

/**
 * Split "http(s)://host[:port]/path" into base and path.
 * Anything not starting with http:// or https:// is rejected.
 */
bool parse_endpoint(const std::string& url, Endpoint& out);

nlohmann::json build_request_body(const std::vector<AudioFrame>& frames, int sample_rate);

// Validate and extract text/confidence. Confidence is clamped to [0, 1].
vg_result_t parse_response_body(const std::string& body, TranscriptionResult& out);

class HttpRemoteTranscriber : public ITranscriber {
   public:
    HttpRemoteTranscriber(std::string url, int timeout_ms);

    vg_result_t transcribe(const std::vector<AudioFrame>& frames, int sample_rate,
                           TranscriptionResult& out) override;
    const char* name() const override { return "remote_http"; }

    const std::string& url() const { return url_; }

   private:
    std::string url_;
    int timeout_ms_;
};

}  // namespace remote
}  // namespace voicegate

#endif  // VG_HTTP_TRANSCRIBER_H
