/**
 * @file test_enrollment.cpp
 * @brief Tests for enrolling the owner from a PCM file
 */

#include <gtest/gtest.h>

#include "test_common.h"
#include "voicegate/features/listener/vg_frame_source.h"
#include "voicegate/features/speaker/vg_enrollment.h"
#include "voicegate/features/speaker/vg_speaker_verifier.h"

using namespace voicegate;

namespace {

constexpr const char* kKeyEnv = "VOICEGATE_TEST_ENROLL_KEY";

class EnrollmentTest : public ::testing::Test {
   protected:
    void SetUp() override {
        vg_test::quiet_logs();
        config_.voiceprint_path = dir_.file("owner.voiceprint");
        config_.voice_key_env = kKeyEnv;
    }

    vg_test::TempDir dir_;
    VoiceGateConfig config_;
};

}  // namespace

TEST_F(EnrollmentTest, ChunksFileAndStoresVoiceprint) {
    vg_test::ScopedEnv env(kKeyEnv, "enroll-secret");
    const std::string audio = dir_.file("owner.pcm");
    vg_test::write_file(audio, std::string(2500, 'x'));

    EnrollmentSummary summary;
    ASSERT_EQ(enroll_from_file(audio, config_, summary), VG_SUCCESS);
    EXPECT_EQ(summary.voiceprint_path, config_.voiceprint_path);
    EXPECT_EQ(summary.frames, 3u);  // 1024 + 1024 + 452
    EXPECT_EQ(summary.embedding_length, static_cast<size_t>(config_.embedding_length));

    std::unique_ptr<SpeakerVerifier> verifier;
    ASSERT_EQ(SpeakerVerifier::from_config(config_, verifier), VG_SUCCESS);
    EXPECT_TRUE(verifier->is_enrolled());

    // The same recording verifies against the stored profile
    std::vector<AudioFrame> frames;
    ASSERT_EQ(read_pcm_frames(audio, kDefaultEnrollChunkSize, frames), VG_SUCCESS);
    float similarity = 0.0f;
    EXPECT_EQ(verifier->verify_owner(frames, config_.listener.sample_rate, similarity),
              VG_SUCCESS);
    EXPECT_NEAR(similarity, 1.0f, 1e-5f);
}

TEST_F(EnrollmentTest, CustomChunkSize) {
    vg_test::ScopedEnv env(kKeyEnv, "enroll-secret");
    const std::string audio = dir_.file("owner.pcm");
    vg_test::write_file(audio, std::string(10, 'y'));

    EnrollmentSummary summary;
    ASSERT_EQ(enroll_from_file(audio, config_, summary, 4), VG_SUCCESS);
    EXPECT_EQ(summary.frames, 3u);
}

TEST_F(EnrollmentTest, MissingSecretCheckedBeforeFile) {
    vg_test::ScopedEnv env(kKeyEnv, nullptr);
    EnrollmentSummary summary;
    EXPECT_EQ(enroll_from_file(dir_.file("does-not-exist.pcm"), config_, summary),
              VG_ERROR_CONFIG_MISSING);
}

TEST_F(EnrollmentTest, MissingFile) {
    vg_test::ScopedEnv env(kKeyEnv, "enroll-secret");
    EnrollmentSummary summary;
    EXPECT_EQ(enroll_from_file(dir_.file("does-not-exist.pcm"), config_, summary),
              VG_ERROR_FILE_READ_FAILED);
}

TEST_F(EnrollmentTest, EmptyFileIsInvalidInput) {
    vg_test::ScopedEnv env(kKeyEnv, "enroll-secret");
    const std::string audio = dir_.file("empty.pcm");
    vg_test::write_file(audio, "");

    EnrollmentSummary summary;
    EXPECT_EQ(enroll_from_file(audio, config_, summary), VG_ERROR_INVALID_INPUT);

    std::unique_ptr<FileVoiceprintStore> store;
    ASSERT_EQ(FileVoiceprintStore::create_with_secret(config_.voiceprint_path, "enroll-secret",
                                                      store),
              VG_SUCCESS);
    EXPECT_FALSE(store->exists());
}
