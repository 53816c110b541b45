/**
 * @file http_transcriber.cpp
 * @brief VoiceGate - HTTP Remote Transcription Backend
 */

#include "http_transcriber.h"

#include <algorithm>
#include <chrono>

#include <httplib.h>

#include "voicegate/core/vg_logger.h"
#include "voicegate/utils/vg_codec_utils.h"

static const char* LOG_CAT = "ASR";

namespace voicegate {
namespace remote {

namespace {

vg_result_t remote_error(const std::string& details) {
    VG_LOG_ERROR(LOG_CAT, "Remote ASR failed: %s", details.c_str());
    vg_error_set_details(details.c_str());
    return VG_ERROR_REMOTE_BACKEND;
}

}  // namespace

bool parse_endpoint(const std::string& url, Endpoint& out) {
    size_t scheme_len = 0;
    if (url.rfind("http://", 0) == 0) {
        scheme_len = 7;
    } else if (url.rfind("https://", 0) == 0) {
        scheme_len = 8;
    } else {
        return false;
    }

    const size_t slash = url.find('/', scheme_len);
    const size_t host_end = (slash == std::string::npos) ? url.size() : slash;
    if (host_end == scheme_len) {
        return false;
    }

    out.base = url.substr(0, host_end);
    out.path = (slash == std::string::npos) ? "/" : url.substr(slash);
    return true;
}

nlohmann::json build_request_body(const std::vector<AudioFrame>& frames, int sample_rate) {
    std::vector<uint8_t> audio;
    for (const auto& frame : frames) {
        audio.insert(audio.end(), frame.begin(), frame.end());
    }
    return {{"sample_rate", sample_rate},
            {"frames", frames.size()},
            {"audio_base64", codec::base64_encode(audio)}};
}

vg_result_t parse_response_body(const std::string& body, TranscriptionResult& out) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return remote_error("response is not a JSON object");
    }

    auto text = j.find("text");
    if (text == j.end() || !text->is_string()) {
        return remote_error("response has no string \"text\"");
    }
    auto confidence = j.find("confidence");
    if (confidence == j.end() || !confidence->is_number()) {
        return remote_error("response has no numeric \"confidence\"");
    }

    out.text = text->get<std::string>();
    out.confidence = std::clamp(confidence->get<float>(), 0.0f, 1.0f);
    return VG_SUCCESS;
}

// =============================================================================
// HTTP BACKEND
// =============================================================================

HttpRemoteTranscriber::HttpRemoteTranscriber(std::string url, int timeout_ms)
    : url_(std::move(url)), timeout_ms_(timeout_ms > 0 ? timeout_ms : 10000) {}

vg_result_t HttpRemoteTranscriber::transcribe(const std::vector<AudioFrame>& frames,
                                              int sample_rate, TranscriptionResult& out) {
    Endpoint endpoint;
    if (!parse_endpoint(url_, endpoint)) {
        return remote_error("invalid endpoint: " + url_);
    }

    httplib::Client client(endpoint.base);
    if (!client.is_valid()) {
        return remote_error("cannot create HTTP client for " + endpoint.base);
    }
    client.set_connection_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_read_timeout(std::chrono::milliseconds(timeout_ms_));
    client.set_write_timeout(std::chrono::milliseconds(timeout_ms_));

    const std::string body = build_request_body(frames, sample_rate).dump();
    VG_LOG_DEBUG(LOG_CAT, "POST %s (%zu frames, %zu bytes)", url_.c_str(), frames.size(),
                 body.size());

    auto res = client.Post(endpoint.path, body, "application/json");
    if (!res) {
        return remote_error("request to " + url_ + " failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        return remote_error("HTTP " + std::to_string(res->status) + " from " + url_);
    }

    TranscriptionResult result;
    vg_result_t rc = parse_response_body(res->body, result);
    if (VG_FAILED(rc)) {
        return rc;
    }
    result.source = name();
    out = std::move(result);
    return VG_SUCCESS;
}

}  // namespace remote
}  // namespace voicegate
