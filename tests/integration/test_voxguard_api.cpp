// Integration tests for the C API (vg_init, vg_analyze, vg_result_to_json, ...).
// These tests exercise the full shared-library interface; no model files are needed.

#include <gtest/gtest.h>
#include <voxguard/voxguard_api.h>
#include <voxguard/voxguard_types.h>
#include "test_audio_utils.h"
#include <atomic>
#include <cstdio>
#include <cstring>
#include <limits>
#include <string>
#include <thread>
#include <vector>

namespace {

class VoxGuardApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        VgConfig config;
        vg_default_config(&config);
        config.log_level = 4;   // errors only
        config.log_file[0] = '\0';
        ASSERT_EQ(vg_init(&config), VG_OK) << vg_get_last_error();
    }

    void TearDown() override {
        vg_release();
    }

    static VgAnalysisResult analyze(const std::vector<float>& pcm, int sr = vgtest::kRate) {
        VgAnalysisResult r;
        EXPECT_EQ(vg_analyze(pcm.data(), static_cast<int>(pcm.size()), sr, &r), VG_OK);
        return r;
    }
};

} // namespace

// ----------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------
TEST(VoxGuardLifecycleTest, CallsBeforeInitFail) {
    std::vector<float> pcm(1000, 0.1f);
    VgAnalysisResult r;
    EXPECT_EQ(vg_analyze(pcm.data(), 1000, vgtest::kRate, &r), VG_ERROR_NOT_INIT);
    EXPECT_NE(std::string(vg_get_last_error()), "");

    VgLanguageResult lang;
    EXPECT_EQ(vg_detect_language(pcm.data(), 1000, vgtest::kRate, &lang), VG_ERROR_NOT_INIT);
    EXPECT_EQ(vg_analyze_file("missing.wav", &r), VG_ERROR_NOT_INIT);
}

TEST(VoxGuardLifecycleTest, DefaultConfig) {
    VgConfig config;
    vg_default_config(&config);
    EXPECT_EQ(config.target_sample_rate, 22050);
    EXPECT_EQ(config.parallel, 1);
    EXPECT_EQ(config.log_level, 2);
    EXPECT_STREQ(config.log_file, "voxguard.log");
    EXPECT_STREQ(config.model_dir, "");
}

TEST(VoxGuardLifecycleTest, RejectsBadConfig) {
    VgConfig config;
    vg_default_config(&config);
    config.log_file[0] = '\0';

    config.target_sample_rate = 0;
    EXPECT_EQ(vg_init(&config), VG_ERROR_INVALID_PARAM);

    config.target_sample_rate = 22050;
    config.log_level = 9;
    EXPECT_EQ(vg_init(&config), VG_ERROR_INVALID_PARAM);
}

TEST(VoxGuardLifecycleTest, InitTwiceAndReinit) {
    VgConfig config;
    vg_default_config(&config);
    config.log_level = 4;
    config.log_file[0] = '\0';
    std::strcpy(config.model_dir, "no_such_model_dir");   // optional slot, not an error

    ASSERT_EQ(vg_init(&config), VG_OK);
    EXPECT_EQ(vg_init(&config), VG_ERROR_ALREADY_INIT);
    vg_release();
    EXPECT_EQ(vg_init(&config), VG_OK);
    vg_release();
    vg_release();   // harmless
}

// ----------------------------------------------------------------
// Full analysis
// ----------------------------------------------------------------
TEST_F(VoxGuardApiTest, SineAnalysis) {
    VgAnalysisResult r = analyze(vgtest::make_sine(440.0f, 3.0f));

    EXPECT_EQ(r.metadata.multilingual_support, 1);
    EXPECT_EQ(r.metadata.ai_detection_enabled, 1);
    EXPECT_STREQ(r.metadata.detection_version, VG_DETECTION_VERSION);
    EXPECT_EQ(std::strlen(r.metadata.analysis_timestamp), 20u);

    EXPECT_STREQ(r.voice_cloning.detection_method, "advanced_multi_method");
    EXPECT_GT(r.voice_cloning.confidence_score, 0.5f);
    EXPECT_FLOAT_EQ(r.voice_cloning.model_score, -1.0f);
    EXPECT_EQ(r.voice_cloning.is_ai_generated, r.voice_cloning.confidence_score > 0.65f ? 1 : 0);

    bool pitch_indicator = false;
    for (int i = 0; i < r.voice_cloning.indicator_count; ++i)
        if (std::strcmp(r.voice_cloning.indicators[i], "extreme_pitch_stability") == 0)
            pitch_indicator = true;
    EXPECT_TRUE(pitch_indicator);

    EXPECT_EQ(r.language.has_features, 1);
    EXPECT_STREQ(r.language.transcription, "");
}

TEST_F(VoxGuardApiTest, WhiteNoiseIsEnglish) {
    VgAnalysisResult r = analyze(vgtest::make_noise(3.0f));
    EXPECT_STREQ(r.language.detected_language, "en");
    EXPECT_STREQ(r.language.language_name, "English");
    EXPECT_TRUE(r.language.confidence == 0.40f || r.language.confidence == 0.55f);
    EXPECT_GE(r.voice_cloning.confidence_score, 0.0f);
    EXPECT_LE(r.voice_cloning.confidence_score, 1.0f);
}

TEST_F(VoxGuardApiTest, ZeroLengthInput) {
    VgAnalysisResult r;
    ASSERT_EQ(vg_analyze(nullptr, 0, vgtest::kRate, &r), VG_OK);
    EXPECT_STREQ(r.language.detected_language, "en");
    EXPECT_FLOAT_EQ(r.language.confidence, 0.10f);
    EXPECT_EQ(r.language.has_features, 0);
    EXPECT_STREQ(r.voice_cloning.detection_method, "error");
    EXPECT_EQ(r.voice_cloning.is_ai_generated, 0);
    EXPECT_FLOAT_EQ(r.voice_cloning.confidence_score, 0.0f);
    EXPECT_EQ(r.voice_cloning.risk_level, VG_RISK_LOW);
}

TEST_F(VoxGuardApiTest, SilentInput) {
    VgAnalysisResult r = analyze(std::vector<float>(3 * vgtest::kRate, 0.0f));
    EXPECT_STREQ(r.language.detected_language, "en");
    EXPECT_FLOAT_EQ(r.language.confidence, 0.40f);
    EXPECT_STREQ(r.voice_cloning.detection_method, "error");
    EXPECT_EQ(r.voice_cloning.is_ai_generated, 0);
}

TEST_F(VoxGuardApiTest, NonFiniteInputNeverThrows) {
    auto pcm = vgtest::make_sine(300.0f, 1.0f);
    pcm[10] = std::numeric_limits<float>::quiet_NaN();
    VgAnalysisResult r = analyze(pcm);
    EXPECT_FLOAT_EQ(r.language.confidence, 0.10f);
    EXPECT_STREQ(r.voice_cloning.detection_method, "error");
}

TEST_F(VoxGuardApiTest, ResamplesOtherRates) {
    VgAnalysisResult r = analyze(vgtest::make_sine(440.0f, 3.0f, 16000), 16000);
    EXPECT_STREQ(r.voice_cloning.detection_method, "advanced_multi_method");
    EXPECT_EQ(r.metadata.multilingual_support, 1);
}

TEST_F(VoxGuardApiTest, InvalidArguments) {
    std::vector<float> pcm(100, 0.1f);
    VgAnalysisResult r;
    EXPECT_EQ(vg_analyze(pcm.data(), 100, vgtest::kRate, nullptr), VG_ERROR_INVALID_PARAM);
    EXPECT_EQ(vg_analyze(nullptr, 100, vgtest::kRate, &r), VG_ERROR_INVALID_PARAM);
    EXPECT_EQ(vg_analyze(pcm.data(), -1, vgtest::kRate, &r), VG_ERROR_INVALID_PARAM);
    EXPECT_EQ(vg_analyze(pcm.data(), 100, 0, &r), VG_ERROR_INVALID_PARAM);
    EXPECT_EQ(vg_analyze_file(nullptr, &r), VG_ERROR_INVALID_PARAM);
    EXPECT_EQ(vg_analyze_buffer(nullptr, 10, &r), VG_ERROR_INVALID_PARAM);
    EXPECT_NE(std::string(vg_get_last_error()), "");
}

TEST_F(VoxGuardApiTest, Deterministic) {
    auto pcm = vgtest::make_voice_like(4.5f);
    VgAnalysisResult a = analyze(pcm);
    VgAnalysisResult b = analyze(pcm);

    EXPECT_STREQ(a.language.detected_language, b.language.detected_language);
    EXPECT_EQ(a.language.confidence, b.language.confidence);
    EXPECT_EQ(a.voice_cloning.confidence_score, b.voice_cloning.confidence_score);
    EXPECT_EQ(a.voice_cloning.heuristic_score, b.voice_cloning.heuristic_score);
    EXPECT_EQ(a.voice_cloning.pattern_score, b.voice_cloning.pattern_score);
    EXPECT_EQ(a.voice_cloning.temporal_score, b.voice_cloning.temporal_score);
    EXPECT_EQ(a.voice_cloning.indicator_count, b.voice_cloning.indicator_count);
}

TEST_F(VoxGuardApiTest, ConcurrentCalls) {
    auto pcm = vgtest::make_voice_like(2.5f);
    VgAnalysisResult reference = analyze(pcm);

    std::atomic<int> mismatches{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 2; ++i) {
                VgAnalysisResult r;
                if (vg_analyze(pcm.data(), static_cast<int>(pcm.size()), vgtest::kRate, &r) != VG_OK ||
                    r.voice_cloning.confidence_score != reference.voice_cloning.confidence_score ||
                    std::strcmp(r.language.detected_language,
                                reference.language.detected_language) != 0) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(mismatches.load(), 0);
}

// ----------------------------------------------------------------
// File and buffer input
// ----------------------------------------------------------------
TEST_F(VoxGuardApiTest, AnalyzeFile) {
    auto pcm = vgtest::make_sine(440.0f, 3.0f);
    std::string path = vgtest::write_file("api_sine.wav", vgtest::pcm16_wav(pcm));

    VgAnalysisResult r;
    ASSERT_EQ(vg_analyze_file(path.c_str(), &r), VG_OK);
    EXPECT_EQ(r.metadata.multilingual_support, 1);
    EXPECT_STREQ(r.voice_cloning.detection_method, "advanced_multi_method");

    VgLanguageResult lang;
    ASSERT_EQ(vg_detect_language_file(path.c_str(), &lang), VG_OK);
    EXPECT_STREQ(lang.detected_language, r.language.detected_language);

    VgVoiceCloningResult vc;
    ASSERT_EQ(vg_detect_voice_cloning_file(path.c_str(), &vc), VG_OK);
    EXPECT_FLOAT_EQ(vc.confidence_score, r.voice_cloning.confidence_score);

    std::remove(path.c_str());
}

TEST_F(VoxGuardApiTest, MissingFileYieldsFallbacks) {
    VgAnalysisResult r;
    ASSERT_EQ(vg_analyze_file("definitely_missing.wav", &r), VG_OK);
    EXPECT_EQ(r.metadata.multilingual_support, 0);
    EXPECT_EQ(r.metadata.ai_detection_enabled, 0);
    EXPECT_STREQ(r.language.detected_language, "en");
    EXPECT_FLOAT_EQ(r.language.confidence, 0.10f);
    EXPECT_STREQ(r.voice_cloning.detection_method, "error");
    EXPECT_NE(std::string(vg_get_last_error()), "");

    VgLanguageResult lang;
    ASSERT_EQ(vg_detect_language_file("definitely_missing.wav", &lang), VG_OK);
    EXPECT_FLOAT_EQ(lang.confidence, 0.10f);

    VgVoiceCloningResult vc;
    ASSERT_EQ(vg_detect_voice_cloning_file("definitely_missing.wav", &vc), VG_OK);
    EXPECT_STREQ(vc.detection_method, "error");
}

TEST_F(VoxGuardApiTest, AnalyzeBuffer) {
    auto bytes = vgtest::float_wav(vgtest::make_sine(440.0f, 3.0f));
    VgAnalysisResult r;
    ASSERT_EQ(vg_analyze_buffer(bytes.data(), static_cast<int>(bytes.size()), &r), VG_OK);
    EXPECT_EQ(r.metadata.ai_detection_enabled, 1);
    EXPECT_STREQ(r.voice_cloning.detection_method, "advanced_multi_method");

    std::string junk = "not audio";
    ASSERT_EQ(vg_analyze_buffer(junk.data(), static_cast<int>(junk.size()), &r), VG_OK);
    EXPECT_EQ(r.metadata.ai_detection_enabled, 0);
    EXPECT_STREQ(r.voice_cloning.detection_method, "error");
}

TEST_F(VoxGuardApiTest, AnalyzeBufferWithOversizedDataChunk) {
    auto bytes = vgtest::float_wav(vgtest::make_sine(440.0f, 3.0f));
    vgtest::set_data_chunk_size(bytes, 0xFFFFFFF0u);

    VgAnalysisResult r;
    ASSERT_EQ(vg_analyze_buffer(bytes.data(), static_cast<int>(bytes.size()), &r), VG_OK)
        << vg_get_last_error();
    EXPECT_EQ(r.metadata.multilingual_support, 1);
    EXPECT_EQ(r.metadata.ai_detection_enabled, 1);
    EXPECT_STREQ(r.voice_cloning.detection_method, "advanced_multi_method");

    std::string path = vgtest::write_file("api_oversized_data.wav", bytes);
    ASSERT_EQ(vg_analyze_file(path.c_str(), &r), VG_OK) << vg_get_last_error();
    EXPECT_EQ(r.metadata.ai_detection_enabled, 1);
    std::remove(path.c_str());
}

// ----------------------------------------------------------------
// Single-branch calls
// ----------------------------------------------------------------
TEST_F(VoxGuardApiTest, SingleBranchCallsMatchFullAnalysis) {
    auto pcm = vgtest::make_voice_like(3.0f);
    VgAnalysisResult full = analyze(pcm);

    VgLanguageResult lang;
    ASSERT_EQ(vg_detect_language(pcm.data(), static_cast<int>(pcm.size()),
                                 vgtest::kRate, &lang), VG_OK);
    EXPECT_STREQ(lang.detected_language, full.language.detected_language);
    EXPECT_EQ(lang.confidence, full.language.confidence);
    for (int i = 0; i < VG_LANGUAGE_COUNT; ++i)
        EXPECT_EQ(lang.features.language_scores[i], full.language.features.language_scores[i]);

    VgVoiceCloningResult vc;
    ASSERT_EQ(vg_detect_voice_cloning(pcm.data(), static_cast<int>(pcm.size()),
                                      vgtest::kRate, &vc), VG_OK);
    EXPECT_EQ(vc.confidence_score, full.voice_cloning.confidence_score);
    EXPECT_EQ(vc.risk_level, full.voice_cloning.risk_level);
}

// ----------------------------------------------------------------
// JSON rendering
// ----------------------------------------------------------------
TEST_F(VoxGuardApiTest, ResultToJson) {
    VgAnalysisResult r = analyze(vgtest::make_sine(440.0f, 3.0f));

    int len = 0;
    EXPECT_EQ(vg_result_to_json(&r, nullptr, 0, &len), VG_ERROR_BUFFER_TOO_SMALL);
    ASSERT_GT(len, 0);

    std::vector<char> small(static_cast<size_t>(len));
    EXPECT_EQ(vg_result_to_json(&r, small.data(), len, &len), VG_ERROR_BUFFER_TOO_SMALL);

    std::vector<char> buf(static_cast<size_t>(len) + 1);
    ASSERT_EQ(vg_result_to_json(&r, buf.data(), len + 1, &len), VG_OK);
    std::string json(buf.data());
    EXPECT_EQ(static_cast<int>(json.size()), len);
    EXPECT_NE(json.find("\"language_detection\""), std::string::npos);
    EXPECT_NE(json.find("\"voice_cloning_detection\""), std::string::npos);
    EXPECT_NE(json.find("\"detection_version\":\"2.0_advanced\""), std::string::npos);

    EXPECT_EQ(vg_result_to_json(nullptr, buf.data(), len + 1, &len), VG_ERROR_INVALID_PARAM);
}

// ----------------------------------------------------------------
// Static tables (no init needed)
// ----------------------------------------------------------------
TEST(VoxGuardTablesTest, SupportedLanguages) {
    ASSERT_EQ(vg_get_supported_language_count(), 4);
    const char* expected[] = {"en", "hi", "kn", "te"};
    for (int i = 0; i < 4; ++i) {
        VgLanguageInfo info;
        ASSERT_EQ(vg_get_supported_language(i, &info), VG_OK);
        EXPECT_STREQ(info.code, expected[i]);
        EXPECT_EQ(info.is_default, i == 0 ? 1 : 0);
    }
    VgLanguageInfo info;
    EXPECT_EQ(vg_get_supported_language(4, &info), VG_ERROR_INVALID_PARAM);
    EXPECT_EQ(vg_get_supported_language(0, nullptr), VG_ERROR_INVALID_PARAM);

    EXPECT_STREQ(vg_default_language(), "en");
    EXPECT_STREQ(vg_language_name("kn"), "Kannada");
    EXPECT_STREQ(vg_language_name("fr"), "fr");
    EXPECT_STREQ(vg_language_name(nullptr), "Unknown");
}

TEST(VoxGuardTablesTest, RiskNamesAndVersion) {
    EXPECT_STREQ(vg_risk_level_name(VG_RISK_LOW), "low");
    EXPECT_STREQ(vg_risk_level_name(VG_RISK_MEDIUM), "medium");
    EXPECT_STREQ(vg_risk_level_name(VG_RISK_HIGH), "high");
    EXPECT_STREQ(vg_risk_level_name(-1), "unknown");
    EXPECT_STREQ(vg_risk_level_name(3), "unknown");
    EXPECT_STRNE(vg_version(), "");
}
