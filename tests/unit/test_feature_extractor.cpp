#include <gtest/gtest.h>
#include "core/feature_extractor.h"
#include "test_audio_utils.h"
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace vg;

TEST(FeatureVectorTest, NameCatalogue) {
    const auto& names = FeatureVector::feature_names();
    ASSERT_EQ(names.size(), 61u);
    EXPECT_EQ(names.front(), "spectral_centroid_mean");
    EXPECT_EQ(names[5], "spectral_centroid_kurtosis");
    EXPECT_EQ(names[59], "tonnetz_kurtosis");
    EXPECT_EQ(names.back(), "mfcc13_std");
    EXPECT_EQ(FeatureVector::key("rms", "std"), "rms_std");
}

TEST(FeatureVectorTest, MissingNamesReadAsZero) {
    FeatureVector fv(ExtractionStatus::OK, {{"rms_std", 0.25f}});
    EXPECT_TRUE(fv.ok());
    EXPECT_FLOAT_EQ(fv.get("rms_std"), 0.25f);
    EXPECT_FLOAT_EQ(fv.get("rms", "std"), 0.25f);
    EXPECT_FLOAT_EQ(fv.get("chroma_mean"), 0.0f);
    EXPECT_FLOAT_EQ(fv.get("no_such_feature"), 0.0f);
    EXPECT_EQ(fv.values().size(), 61u);
}

TEST(FeatureVectorTest, AdvancedVectorOrder) {
    FeatureVector fv(ExtractionStatus::OK,
                     {{"spectral_centroid_mean", 1.0f}, {"tonnetz_kurtosis", 2.0f},
                      {"mfcc13_std", 3.0f}});
    auto v = fv.advanced_vector();
    ASSERT_EQ(v.size(), static_cast<size_t>(FeatureVector::kAdvancedSize));
    EXPECT_FLOAT_EQ(v.front(), 1.0f);
    EXPECT_FLOAT_EQ(v.back(), 2.0f);
}

TEST(FeatureExtractorTest, EmptySignal) {
    FeatureExtractor extractor;
    FeatureVector fv = extractor.extract(std::vector<float>());
    EXPECT_EQ(fv.status(), ExtractionStatus::EMPTY);
    for (const auto& kv : fv.values()) EXPECT_FLOAT_EQ(kv.second, 0.0f) << kv.first;
}

TEST(FeatureExtractorTest, SilentSignal) {
    FeatureExtractor extractor;
    FeatureVector fv = extractor.extract(std::vector<float>(3 * vgtest::kRate, 0.0f));
    EXPECT_EQ(fv.status(), ExtractionStatus::SILENT);
    EXPECT_FALSE(fv.ok());
    EXPECT_EQ(fv.values().size(), 61u);
}

TEST(FeatureExtractorTest, NonFiniteSamplesFail) {
    FeatureExtractor extractor;
    auto pcm = vgtest::make_sine(440.0f, 1.0f);
    pcm[100] = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(extractor.extract(pcm).status(), ExtractionStatus::FAILED);

    pcm[100] = std::numeric_limits<float>::infinity();
    EXPECT_EQ(extractor.extract(pcm).status(), ExtractionStatus::FAILED);
}

TEST(FeatureExtractorTest, SineFeatures) {
    FeatureExtractor extractor;
    FeatureVector fv = extractor.extract(vgtest::make_sine(440.0f, 3.0f));
    ASSERT_TRUE(fv.ok());

    for (const auto& name : FeatureVector::feature_names()) {
        ASSERT_EQ(fv.values().count(name), 1u) << name;
        EXPECT_TRUE(std::isfinite(fv.get(name))) << name;
    }
    EXPECT_NEAR(fv.get("zero_crossing_rate_mean"), 2.0f * 440.0f / vgtest::kRate, 0.005f);
    EXPECT_NEAR(fv.get("rms_mean"), 0.5f / std::sqrt(2.0f), 0.02f);
    EXPECT_GT(fv.get("spectral_centroid_mean"), 300.0f);
    EXPECT_LT(fv.get("spectral_centroid_mean"), 800.0f);
    EXPECT_GE(fv.get("spectral_centroid_std"), 0.0f);
    EXPECT_GE(fv.get("mfcc13_std"), 0.0f);
}

TEST(FeatureExtractorTest, ResamplesWaveform) {
    FeatureExtractor extractor(22050);
    Waveform wav;
    wav.sample_rate = 16000;
    wav.samples = vgtest::make_sine(440.0f, 2.0f, 16000);
    FeatureVector fv = extractor.extract(wav);
    ASSERT_TRUE(fv.ok());
    EXPECT_NEAR(fv.get("zero_crossing_rate_mean"), 2.0f * 440.0f / 22050.0f, 0.005f);
}

TEST(FeatureExtractorTest, ShortSignalStillExtracts) {
    FeatureExtractor extractor;
    FeatureVector fv = extractor.extract(vgtest::make_noise(0.05f));
    EXPECT_TRUE(fv.ok());
}

TEST(FeatureExtractorTest, Deterministic) {
    FeatureExtractor extractor;
    auto pcm = vgtest::make_voice_like(2.0f);
    FeatureVector a = extractor.extract(pcm);
    FeatureVector b = extractor.extract(pcm);
    ASSERT_TRUE(a.ok());
    EXPECT_EQ(a.values(), b.values());
}

TEST(ExtractionStatusTest, Names) {
    EXPECT_STREQ(extraction_status_name(ExtractionStatus::OK), "ok");
    EXPECT_STREQ(extraction_status_name(ExtractionStatus::SILENT), "silent");
    EXPECT_STREQ(extraction_status_name(ExtractionStatus::EMPTY), "empty");
    EXPECT_STREQ(extraction_status_name(ExtractionStatus::FAILED), "failed");
}
