/**
 * @file test_transcription_router.cpp
 * @brief Tests for local-first transcription routing
 */

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "test_common.h"
#include "voicegate/features/stt/vg_transcription_router.h"

using namespace voicegate;
using namespace std::chrono_literals;

namespace {

class FailingTranscriber : public ITranscriber {
   public:
    explicit FailingTranscriber(vg_result_t code = VG_ERROR_REMOTE_BACKEND,
                                std::string details = "backend unavailable")
        : code_(code), details_(std::move(details)) {}

    vg_result_t transcribe(const std::vector<AudioFrame>&, int, TranscriptionResult&) override {
        ++calls;
        vg_error_set_details(details_.c_str());
        return code_;
    }
    const char* name() const override { return "failing"; }

    int calls = 0;

   private:
    vg_result_t code_;
    std::string details_;
};

// Fixed answer, counts calls
class ScriptedTranscriber : public ITranscriber {
   public:
    ScriptedTranscriber(std::string text, float confidence)
        : text_(std::move(text)), confidence_(confidence) {}

    vg_result_t transcribe(const std::vector<AudioFrame>& frames, int,
                           TranscriptionResult& out) override {
        ++calls;
        last_frame_count = frames.size();
        out.text = text_;
        out.confidence = confidence_;
        out.source = name();
        return VG_SUCCESS;
    }
    const char* name() const override { return "scripted"; }

    int calls = 0;
    size_t last_frame_count = 0;

   private:
    std::string text_;
    float confidence_;
};

const std::vector<AudioFrame>& command_frames() {
    static const std::vector<AudioFrame> frames = {make_frame("  turn on "),
                                                   make_frame("the lights  ")};
    return frames;
}

class RouterTest : public ::testing::Test {
   protected:
    void SetUp() override { vg_test::quiet_logs(); }

    std::unique_ptr<TranscriptionRouter> make_router(float threshold, int stream_timeout_ms = 5000) {
        RouterConfig config;
        config.confidence_threshold = threshold;
        config.stream_timeout_ms = stream_timeout_ms;
        return std::make_unique<TranscriptionRouter>(std::make_unique<LocalTextTranscriber>(),
                                                     std::make_unique<CloudFallbackTranscriber>(),
                                                     config, &metrics_);
    }

    InMemoryMetricsSink metrics_;
};

}  // namespace

// =============================================================================
// BACKENDS
// =============================================================================

TEST(Transcribers, FramesToTextTrimsAndJoins) {
    EXPECT_EQ(frames_to_text(command_frames()), "turn on the lights");
    EXPECT_EQ(frames_to_text({}), "");
    EXPECT_EQ(frames_to_text({AudioFrame{0xFF, 'o', 'k', 0xFE}}), "ok");
}

TEST(Transcribers, FixedConfidences) {
    LocalTextTranscriber local;
    CloudFallbackTranscriber cloud;
    TranscriptionResult out;

    ASSERT_EQ(local.transcribe(command_frames(), 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.text, "turn on the lights");
    EXPECT_FLOAT_EQ(out.confidence, 0.65f);
    EXPECT_EQ(out.source, "local_whisper");

    ASSERT_EQ(cloud.transcribe(command_frames(), 16000, out), VG_SUCCESS);
    EXPECT_FLOAT_EQ(out.confidence, 0.85f);
    EXPECT_EQ(out.source, "cloud_fallback");

    ASSERT_EQ(local.transcribe({make_frame("   ")}, 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.text, "");
    EXPECT_FLOAT_EQ(out.confidence, 0.0f);
}

// =============================================================================
// ROUTING
// =============================================================================

TEST_F(RouterTest, LowLocalConfidenceFallsBackToRemote) {
    auto router = make_router(0.7f);
    TranscriptionResult out;
    ASSERT_EQ(router->transcribe(command_frames(), 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.text, "turn on the lights");
    EXPECT_EQ(out.source, "cloud_fallback");
    EXPECT_FLOAT_EQ(out.confidence, 0.85f);
    ASSERT_TRUE(out.latency_ms.has_value());
    EXPECT_GE(*out.latency_ms, 0.0);

    EXPECT_EQ(metrics_.counter(metric::kAsrRemoteFallback), 1);
    EXPECT_EQ(metrics_.counter(metric::kAsrLocal), 0);
    EXPECT_EQ(metrics_.timings(metric::kAsrLatencyMs).size(), 1u);
}

TEST_F(RouterTest, ConfidentLocalResultIsKept) {
    auto router = make_router(0.6f);
    TranscriptionResult out;
    ASSERT_EQ(router->transcribe(command_frames(), 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.source, "local_whisper");
    EXPECT_FLOAT_EQ(out.confidence, 0.65f);
    EXPECT_EQ(metrics_.counter(metric::kAsrLocal), 1);
    EXPECT_EQ(metrics_.counter(metric::kAsrRemoteFallback), 0);
}

TEST_F(RouterTest, ThresholdIsInclusive) {
    auto remote = std::make_unique<ScriptedTranscriber>("remote", 1.0f);
    ScriptedTranscriber* remote_ptr = remote.get();
    RouterConfig config;
    config.confidence_threshold = 0.5f;
    TranscriptionRouter router(std::make_unique<ScriptedTranscriber>("local", 0.5f),
                               std::move(remote), config, &metrics_);

    TranscriptionResult out;
    ASSERT_EQ(router.transcribe(command_frames(), 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.text, "local");
    EXPECT_EQ(remote_ptr->calls, 0);
}

TEST_F(RouterTest, RemoteFailurePropagates) {
    auto remote = std::make_unique<FailingTranscriber>();
    FailingTranscriber* remote_ptr = remote.get();
    RouterConfig config;
    TranscriptionRouter router(std::make_unique<LocalTextTranscriber>(), std::move(remote), config,
                               &metrics_);

    TranscriptionResult out;
    out.text = "untouched";
    EXPECT_EQ(router.transcribe(command_frames(), 16000, out), VG_ERROR_REMOTE_BACKEND);
    EXPECT_EQ(out.text, "untouched");
    EXPECT_EQ(remote_ptr->calls, 1);
    EXPECT_EQ(metrics_.counter(metric::kAsrRemoteFallback), 1);
    EXPECT_EQ(metrics_.counter(metric::kAsrRemoteFailed), 1);
}

TEST_F(RouterTest, AnyRemoteFailureIsReportedAsRemoteBackend) {
    TranscriptionRouter router(
        std::make_unique<LocalTextTranscriber>(),
        std::make_unique<FailingTranscriber>(VG_ERROR_INVALID_INPUT, "unsupported sample rate"),
        RouterConfig(), &metrics_);

    TranscriptionResult out;
    EXPECT_EQ(router.transcribe(command_frames(), 16000, out), VG_ERROR_REMOTE_BACKEND);
    const std::string details = vg_error_get_details();
    EXPECT_NE(details.find("unsupported sample rate"), std::string::npos);
    EXPECT_NE(details.find(vg_error_code_name(VG_ERROR_INVALID_INPUT)), std::string::npos);
    EXPECT_EQ(metrics_.counter(metric::kAsrRemoteFailed), 1);

    TranscriptionRouter missing(
        std::make_unique<LocalTextTranscriber>(),
        std::make_unique<FailingTranscriber>(VG_ERROR_PROVIDER_NOT_FOUND, ""), RouterConfig(),
        &metrics_);
    EXPECT_EQ(missing.transcribe(command_frames(), 16000, out), VG_ERROR_REMOTE_BACKEND);
    EXPECT_EQ(metrics_.counter(metric::kAsrRemoteFailed), 2);
}

TEST_F(RouterTest, LocalFailureFallsBackToRemote) {
    TranscriptionRouter router(std::make_unique<FailingTranscriber>(),
                               std::make_unique<CloudFallbackTranscriber>(), RouterConfig(),
                               &metrics_);
    TranscriptionResult out;
    ASSERT_EQ(router.transcribe(command_frames(), 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.source, "cloud_fallback");
}

TEST_F(RouterTest, VerifiedAudioOverload) {
    auto remote = std::make_unique<ScriptedTranscriber>("ok", 0.9f);
    ScriptedTranscriber* remote_ptr = remote.get();
    TranscriptionRouter router(std::make_unique<LocalTextTranscriber>(), std::move(remote),
                               RouterConfig(), &metrics_);

    TranscriptionResult out;
    ASSERT_EQ(router.transcribe(VerifiedAudio(command_frames(), 16000), out), VG_SUCCESS);
    EXPECT_EQ(out.source, "scripted");
    EXPECT_EQ(remote_ptr->last_frame_count, 2u);
}

TEST_F(RouterTest, ThresholdCanBeChanged) {
    auto router = make_router(0.7f);
    router->set_confidence_threshold(0.1f);
    EXPECT_FLOAT_EQ(router->confidence_threshold(), 0.1f);

    TranscriptionResult out;
    ASSERT_EQ(router->transcribe(command_frames(), 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.source, "local_whisper");
}

// =============================================================================
// STREAMING
// =============================================================================

TEST_F(RouterTest, StreamingCollectsUntilClosed) {
    auto router = make_router(0.7f);
    FrameChannel channel;
    std::thread producer([&channel] {
        channel.push(make_frame("hello"));
        std::this_thread::sleep_for(5ms);
        channel.push(make_frame(" world"));
        channel.close();
    });

    TranscriptionResult out;
    ASSERT_EQ(router->transcribe_streaming(channel, 16000, out), VG_SUCCESS);
    producer.join();
    EXPECT_EQ(out.text, "hello world");
    EXPECT_EQ(out.source, "cloud_fallback_stream");
    EXPECT_EQ(metrics_.counter(metric::kAsrStreamTimeout), 0);
}

TEST_F(RouterTest, StreamingLocalTag) {
    auto router = make_router(0.6f);
    VectorFrameSource source({make_frame("hello"), make_frame(" world")});

    TranscriptionResult out;
    ASSERT_EQ(router->transcribe_streaming(source, 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.text, "hello world");
    EXPECT_EQ(out.source, "local_whisper_local_stream");
}

TEST_F(RouterTest, StreamingTimeoutRoutesWhatArrived) {
    auto router = make_router(0.7f, 20);
    FrameChannel channel;
    ASSERT_TRUE(channel.push(make_frame("partial")));
    std::thread late([&channel] {
        std::this_thread::sleep_for(200ms);
        channel.push(make_frame(" too late"));
        channel.close();
    });

    TranscriptionResult out;
    ASSERT_EQ(router->transcribe_streaming(channel, 16000, out), VG_SUCCESS);
    late.join();
    EXPECT_EQ(out.text, "partial");
    EXPECT_EQ(out.source, "cloud_fallback_stream");
    EXPECT_EQ(metrics_.counter(metric::kAsrStreamTimeout), 1);
}

TEST_F(RouterTest, StreamingTimeoutWithNothingIsNotAnError) {
    auto router = make_router(0.7f, 10);
    FrameChannel channel;

    TranscriptionResult out;
    ASSERT_EQ(router->transcribe_streaming(channel, 16000, out), VG_SUCCESS);
    EXPECT_EQ(out.text, "");
    EXPECT_FLOAT_EQ(out.confidence, 0.0f);
    EXPECT_EQ(metrics_.counter(metric::kAsrStreamTimeout), 1);
}

TEST_F(RouterTest, FromConfigUsesCloudPlaceholderWithoutEndpoint) {
    VoiceGateConfig config;
    config.router.confidence_threshold = 0.6f;
    std::unique_ptr<TranscriptionRouter> router;
    ASSERT_EQ(TranscriptionRouter::from_config(config, router, &metrics_), VG_SUCCESS);
    EXPECT_FLOAT_EQ(router->confidence_threshold(), 0.6f);

    config.remote_endpoint = std::string("grpc://asr");
    EXPECT_EQ(TranscriptionRouter::from_config(config, router, &metrics_),
              VG_ERROR_CONFIG_INVALID);
}
