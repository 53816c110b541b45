/**
 * @file test_speaker_verifier.cpp
 * @brief Tests for embeddings, cosine similarity and the speaker verifier
 */

#include <gtest/gtest.h>

#include <cmath>

#include "test_common.h"
#include "voicegate/features/speaker/vg_speaker_verifier.h"

using namespace voicegate;

namespace {

// Embedding fixed per first byte of the first frame, so tests control similarity
class LookupModel : public IEmbeddingModel {
   public:
    vg_result_t embed(const std::vector<AudioFrame>& frames, int, Embedding& out) override {
        if (frames.empty() || frames[0].empty()) {
            out = {0.0f, 0.0f, 0.0f};
        } else if (frames[0][0] == 'a') {
            out = {1.0f, 0.0f, 0.0f};
        } else if (frames[0][0] == 'b') {
            out = {0.0f, 1.0f, 0.0f};
        } else {
            out = {1.0f, 1.0f, 0.0f};  // cos 0.707 with both a and b
        }
        return VG_SUCCESS;
    }
    size_t dimension() const override { return 3; }
    const char* name() const override { return "lookup"; }
};

class SpeakerVerifierTest : public ::testing::Test {
   protected:
    void SetUp() override { vg_test::quiet_logs(); }

    std::unique_ptr<SpeakerVerifier> make_verifier(std::unique_ptr<IEmbeddingModel> model,
                                                   float threshold = 0.8f) {
        std::unique_ptr<FileVoiceprintStore> store;
        EXPECT_EQ(FileVoiceprintStore::create_with_secret(dir_.file("owner.voiceprint"),
                                                          "verifier-key", store),
                  VG_SUCCESS);
        return std::make_unique<SpeakerVerifier>(std::move(model), std::move(store), threshold);
    }

    vg_test::TempDir dir_;
};

}  // namespace

// =============================================================================
// COSINE SIMILARITY
// =============================================================================

TEST(CosineSimilarity, SymmetricAndSelfIsOne) {
    const Embedding a = {1.0f, 2.0f, 3.0f};
    const Embedding b = {-4.0f, 0.5f, 2.0f};
    float ab = 0.0f;
    float ba = 0.0f;
    float aa = 0.0f;
    ASSERT_EQ(cosine_similarity(a, b, ab), VG_SUCCESS);
    ASSERT_EQ(cosine_similarity(b, a, ba), VG_SUCCESS);
    ASSERT_EQ(cosine_similarity(a, a, aa), VG_SUCCESS);
    EXPECT_FLOAT_EQ(ab, ba);
    EXPECT_NEAR(aa, 1.0f, 1e-6f);
}

TEST(CosineSimilarity, ZeroNormIsZero) {
    float out = -1.0f;
    ASSERT_EQ(cosine_similarity({0.0f, 0.0f}, {1.0f, 2.0f}, out), VG_SUCCESS);
    EXPECT_EQ(out, 0.0f);
    ASSERT_EQ(cosine_similarity({}, {}, out), VG_SUCCESS);
    EXPECT_EQ(out, 0.0f);
}

TEST(CosineSimilarity, UnequalLengthIsInvalidInput) {
    float out = 0.0f;
    EXPECT_EQ(cosine_similarity({1.0f, 2.0f}, {1.0f, 2.0f, 3.0f}, out), VG_ERROR_INVALID_INPUT);
}

TEST(CosineSimilarity, Orthogonal) {
    float out = 1.0f;
    ASSERT_EQ(cosine_similarity({1.0f, 0.0f}, {0.0f, 5.0f}, out), VG_SUCCESS);
    EXPECT_NEAR(out, 0.0f, 1e-7f);
}

// =============================================================================
// HASH EMBEDDING
// =============================================================================

TEST(HashEmbedding, DeterministicAndBounded) {
    HashEmbeddingModel model;
    const std::vector<AudioFrame> frames = {make_frame("jarvis"), make_frame("lights on")};
    Embedding first;
    Embedding second;
    ASSERT_EQ(model.embed(frames, 16000, first), VG_SUCCESS);
    ASSERT_EQ(model.embed(frames, 16000, second), VG_SUCCESS);
    EXPECT_EQ(first, second);
    ASSERT_EQ(first.size(), 32u);
    for (float v : first) {
        EXPECT_GE(v, 0.0f);
        EXPECT_LE(v, 255.0f);
    }
}

TEST(HashEmbedding, SingleFrameIsDigestBytes) {
    HashEmbeddingModel model(4);
    Embedding out;
    ASSERT_EQ(model.embed({make_frame("abc")}, 16000, out), VG_SUCCESS);
    // SHA-256("abc") = ba 78 16 bf ...
    EXPECT_EQ(out, Embedding({186.0f, 120.0f, 22.0f, 191.0f}));
}

TEST(HashEmbedding, NoFramesIsZeroVector) {
    HashEmbeddingModel model(8);
    Embedding out;
    ASSERT_EQ(model.embed({}, 16000, out), VG_SUCCESS);
    EXPECT_EQ(out, Embedding(8, 0.0f));
}

TEST(HashEmbedding, LengthIsClamped) {
    EXPECT_EQ(HashEmbeddingModel(0).dimension(), 1u);
    EXPECT_EQ(HashEmbeddingModel(64).dimension(), 32u);
}

// =============================================================================
// VERIFIER
// =============================================================================

TEST_F(SpeakerVerifierTest, VerifyBeforeEnrollIsEnrollmentMissing) {
    auto verifier = make_verifier(std::make_unique<LookupModel>());
    float similarity = 0.0f;
    EXPECT_FALSE(verifier->is_enrolled());
    EXPECT_EQ(verifier->verify_owner({make_frame("a")}, 16000, similarity),
              VG_ERROR_ENROLLMENT_MISSING);
}

TEST_F(SpeakerVerifierTest, EnrolledOwnerVerifies) {
    auto verifier = make_verifier(std::make_unique<LookupModel>());
    Embedding enrolled;
    ASSERT_EQ(verifier->enroll_owner({make_frame("a")}, 16000, enrolled), VG_SUCCESS);
    EXPECT_EQ(enrolled, Embedding({1.0f, 0.0f, 0.0f}));

    float similarity = 0.0f;
    ASSERT_EQ(verifier->verify_owner({make_frame("a again")}, 16000, similarity), VG_SUCCESS);
    EXPECT_NEAR(similarity, 1.0f, 1e-6f);
}

TEST_F(SpeakerVerifierTest, OtherSpeakerIsMismatch) {
    auto verifier = make_verifier(std::make_unique<LookupModel>());
    Embedding enrolled;
    ASSERT_EQ(verifier->enroll_owner({make_frame("a")}, 16000, enrolled), VG_SUCCESS);

    float similarity = -1.0f;
    EXPECT_EQ(verifier->verify_owner({make_frame("b")}, 16000, similarity),
              VG_ERROR_SPEAKER_MISMATCH);
    EXPECT_NEAR(similarity, 0.0f, 1e-6f);
}

TEST_F(SpeakerVerifierTest, ThresholdIsInclusive) {
    auto verifier = make_verifier(std::make_unique<LookupModel>(), 0.7f);
    Embedding enrolled;
    ASSERT_EQ(verifier->enroll_owner({make_frame("a")}, 16000, enrolled), VG_SUCCESS);

    float similarity = 0.0f;
    // cos((1,1,0), (1,0,0)) = 0.7071
    EXPECT_EQ(verifier->verify_owner({make_frame("c")}, 16000, similarity), VG_SUCCESS);
    EXPECT_NEAR(similarity, 1.0f / std::sqrt(2.0f), 1e-6f);
}

TEST_F(SpeakerVerifierTest, ReEnrollmentReplacesProfile) {
    auto verifier = make_verifier(std::make_unique<LookupModel>());
    Embedding enrolled;
    ASSERT_EQ(verifier->enroll_owner({make_frame("a")}, 16000, enrolled), VG_SUCCESS);
    ASSERT_EQ(verifier->enroll_owner({make_frame("b")}, 16000, enrolled), VG_SUCCESS);

    float similarity = 0.0f;
    EXPECT_EQ(verifier->verify_owner({make_frame("a")}, 16000, similarity),
              VG_ERROR_SPEAKER_MISMATCH);
    EXPECT_EQ(verifier->verify_owner({make_frame("b")}, 16000, similarity), VG_SUCCESS);
}

TEST_F(SpeakerVerifierTest, LengthChangeIsInvalidInput) {
    auto verifier = make_verifier(std::make_unique<HashEmbeddingModel>(16));
    Embedding enrolled;
    ASSERT_EQ(verifier->enroll_owner({make_frame("owner")}, 16000, enrolled), VG_SUCCESS);

    auto other = make_verifier(std::make_unique<HashEmbeddingModel>(32));
    float similarity = 0.0f;
    EXPECT_EQ(other->verify_owner({make_frame("owner")}, 16000, similarity),
              VG_ERROR_INVALID_INPUT);
}

TEST_F(SpeakerVerifierTest, HashModelSameAudioVerifies) {
    auto verifier = make_verifier(std::make_unique<HashEmbeddingModel>());
    const std::vector<AudioFrame> frames = {make_frame("jarvis wake"), make_frame("do a task")};
    Embedding enrolled;
    ASSERT_EQ(verifier->enroll_owner(frames, 16000, enrolled), VG_SUCCESS);
    float similarity = 0.0f;
    EXPECT_EQ(verifier->verify_owner(frames, 16000, similarity), VG_SUCCESS);
    EXPECT_NEAR(similarity, 1.0f, 1e-5f);
}

TEST_F(SpeakerVerifierTest, FromConfigNeedsSecret) {
    VoiceGateConfig config;
    config.voiceprint_path = dir_.file("cfg.voiceprint");
    config.voice_key_env = "VOICEGATE_TEST_VERIFIER_KEY";

    std::unique_ptr<SpeakerVerifier> verifier;
    {
        vg_test::ScopedEnv env(config.voice_key_env, nullptr);
        EXPECT_EQ(SpeakerVerifier::from_config(config, verifier), VG_ERROR_CONFIG_MISSING);
    }
    {
        vg_test::ScopedEnv env(config.voice_key_env, "k");
        config.verify_threshold = 0.6f;
        ASSERT_EQ(SpeakerVerifier::from_config(config, verifier), VG_SUCCESS);
        EXPECT_FLOAT_EQ(verifier->threshold(), 0.6f);
    }
}
