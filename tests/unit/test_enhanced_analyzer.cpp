#include <gtest/gtest.h>
#include "core/enhanced_analyzer.h"
#include "core/feature_extractor.h"
#include "core/language_scorer.h"
#include "core/voice_cloning_detector.h"
#include "test_audio_utils.h"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace vg;

namespace {

class ThrowingLanguageScorer : public LanguageScorer {
public:
    LanguageDetectionResult detect(const FeatureVector&) const override {
        throw std::runtime_error("language scorer failure");
    }
};

class ThrowingDetector : public VoiceCloningDetector {
public:
    VoiceCloningDetectionResult detect(const Waveform&, const FeatureVector&) const override {
        throw std::runtime_error("detector failure");
    }
};

AnalyzerConfig make_config(bool parallel) {
    AnalyzerConfig config;
    config.parallel = parallel;
    config.log_file.clear();
    return config;
}

Waveform make_wave(std::vector<float> pcm) {
    Waveform wav;
    wav.samples = std::move(pcm);
    wav.sample_rate = vgtest::kRate;
    return wav;
}

} // namespace

// ----------------------------------------------------------------
// Branch failure isolation
// ----------------------------------------------------------------
TEST(BranchFailureTest, LanguageFailureKeepsDetection) {
    Waveform wav = make_wave(vgtest::make_voice_like(4.5f));
    for (bool parallel : {true, false}) {
        SCOPED_TRACE(parallel ? "parallel" : "sequential");

        EnhancedAnalyzer healthy(make_config(parallel));
        EnhancedAnalyzer broken(make_config(parallel),
                                std::make_unique<ThrowingLanguageScorer>(), nullptr);

        auto expected = healthy.analyze(wav);
        auto r = broken.analyze(wav);

        EXPECT_EQ(r.language.detected_language, "en");
        EXPECT_FLOAT_EQ(r.language.confidence, LanguageScorer::kFallbackConfidence);
        EXPECT_FALSE(r.language.has_diagnostics);

        EXPECT_EQ(r.voice_cloning.detection_method, "advanced_multi_method");
        EXPECT_EQ(r.voice_cloning.confidence_score, expected.voice_cloning.confidence_score);
        EXPECT_EQ(r.voice_cloning.indicators, expected.voice_cloning.indicators);
        EXPECT_TRUE(r.metadata.multilingual_support);
        EXPECT_TRUE(r.metadata.ai_detection_enabled);
    }
}

TEST(BranchFailureTest, DetectorFailureKeepsLanguage) {
    Waveform wav = make_wave(vgtest::make_voice_like(4.5f));
    for (bool parallel : {true, false}) {
        SCOPED_TRACE(parallel ? "parallel" : "sequential");

        EnhancedAnalyzer healthy(make_config(parallel));
        EnhancedAnalyzer broken(make_config(parallel), nullptr,
                                std::make_unique<ThrowingDetector>());

        auto expected = healthy.analyze(wav);
        auto r = broken.analyze(wav);

        EXPECT_EQ(r.voice_cloning.detection_method, "error");
        EXPECT_FALSE(r.voice_cloning.is_ai_generated);
        EXPECT_FLOAT_EQ(r.voice_cloning.confidence_score, 0.0f);
        EXPECT_EQ(r.voice_cloning.risk_level, RiskLevel::LOW);

        EXPECT_EQ(r.language.detected_language, expected.language.detected_language);
        EXPECT_EQ(r.language.confidence, expected.language.confidence);
        EXPECT_TRUE(r.language.has_diagnostics);
        EXPECT_EQ(r.language.diagnostics.language_scores, expected.language.diagnostics.language_scores);
        EXPECT_TRUE(r.metadata.ai_detection_enabled);
    }
}

TEST(EnhancedAnalyzerTest, SingleBranchCallsUseFallbackOnFailure) {
    Waveform wav = make_wave(vgtest::make_sine(440.0f, 3.0f));
    EnhancedAnalyzer broken(make_config(true), std::make_unique<ThrowingLanguageScorer>(),
                            std::make_unique<ThrowingDetector>());

    auto lang = broken.detect_language(wav);
    EXPECT_EQ(lang.detected_language, "en");
    EXPECT_FLOAT_EQ(lang.confidence, LanguageScorer::kFallbackConfidence);

    auto vc = broken.detect_voice_cloning(wav);
    EXPECT_EQ(vc.detection_method, "error");
}

TEST(EnhancedAnalyzerTest, UndecodableBufferReportsWhy) {
    EnhancedAnalyzer analyzer(make_config(false));
    std::string junk = "RIFF but nothing else";
    std::string error;

    auto r = analyzer.analyze_buffer(junk.data(), junk.size(), &error);
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(r.metadata.multilingual_support);
    EXPECT_FALSE(r.metadata.ai_detection_enabled);
    EXPECT_EQ(r.voice_cloning.detection_method, "error");
    EXPECT_FLOAT_EQ(r.language.confidence, LanguageScorer::kFallbackConfidence);
}

// ----------------------------------------------------------------
// Long clips
// ----------------------------------------------------------------
TEST(EnhancedAnalyzerTest, TenSecondsOfNoise) {
    Waveform wav = make_wave(vgtest::make_noise(10.0f));
    EnhancedAnalyzer analyzer(make_config(true));

    EnhancedAnalysisResult r;
    ASSERT_NO_THROW(r = analyzer.analyze(wav));

    // A non-default language needs a winning score of at least 2
    ASSERT_TRUE(r.language.has_diagnostics);
    const auto& scores = r.language.diagnostics.language_scores;
    ASSERT_EQ(scores.count(r.language.detected_language), 1u);
    if (r.language.detected_language != "en") {
        EXPECT_GE(scores.at(r.language.detected_language), 2);
        EXPECT_GE(r.language.confidence, 0.55f);
    }

    const auto& vc = r.voice_cloning;
    EXPECT_EQ(vc.detection_method, "advanced_multi_method");
    ASSERT_TRUE(vc.has_component_scores);
    EXPECT_GE(vc.confidence_score, 0.0f);
    EXPECT_LE(vc.confidence_score, 1.0f);
    EXPECT_EQ(vc.is_ai_generated, vc.confidence_score > VoiceCloningDetector::kDecisionThreshold);
    EXPECT_EQ(vc.risk_level, VoiceCloningDetector::risk_level_for(vc.confidence_score));
    EXPECT_NEAR(vc.confidence_score,
                VoiceCloningDetector::fuse(vc.component_scores.heuristic,
                                           vc.component_scores.pattern,
                                           vc.component_scores.temporal), 1e-6f);

    // Five 2-second segments: the temporal component is measured, not skipped
    VoiceCloningDetector detector;
    EXPECT_FLOAT_EQ(vc.component_scores.temporal, detector.temporal_score(wav.samples).score);
    EXPECT_GE(vc.component_scores.temporal, 0.0f);
    EXPECT_LE(vc.component_scores.temporal, 1.0f);
}
