#include "core/language_scorer.h"
#include "core/language_table.h"
#include "utils/logger.h"
#include <exception>

namespace vg {

namespace {

// Confidence steps of the winning score
struct ConfidenceStep { int min_score; float confidence; };
const ConfidenceStep kConfidenceSteps[] = {
    {6, 0.85f},
    {4, 0.70f},
    {2, 0.55f},
};
constexpr float kLowConfidence = 0.40f;

std::string format_scores(const std::map<std::string, int>& scores) {
    std::string s;
    for (const auto& rule : LanguageScorer::rules()) {
        if (!s.empty()) s += ", ";
        s += rule.code;
        s += "=";
        s += std::to_string(scores.at(rule.code));
    }
    return s;
}

} // anonymous namespace

const std::vector<LanguageRule>& LanguageScorer::rules() {
    //  code   centroid        roll-off        w   zcr            w   bandwidth      w   mfcc std    w
    static const std::vector<LanguageRule> kRules = {
        {"kn", {1100, 1900}, {1800, 3500}, 3, {0.02f, 0.11f}, 2, {800, 1400},  2, {8, 18},  1},
        {"te", {1500, 2200}, {3000, 4500}, 3, {0.05f, 0.14f}, 2, {1000, 1600}, 2, {10, 20}, 1},
        {"hi", {1300, 2000}, {2200, 4000}, 3, {0.04f, 0.13f}, 2, {900, 1500},  2, {9, 19},  1},
        {"en", {1200, 4000}, {2000, 7000}, 4, {0.02f, 0.25f}, 3, {900, 2200},  2, {10, 35}, 2},
    };
    return kRules;
}

std::map<std::string, int> LanguageScorer::score_table(const FeatureVector& features) {
    const float centroid  = features.get("spectral_centroid_mean");
    const float rolloff   = features.get("spectral_rolloff_mean");
    const float bandwidth = features.get("spectral_bandwidth_mean");
    const float zcr       = features.get("zero_crossing_rate_mean");
    const float mfcc_std  = features.get("mfcc13_std");

    std::map<std::string, int> scores;
    for (const auto& lang : supported_languages()) scores[lang.code] = 0;

    for (const auto& rule : rules()) {
        int score = 0;
        if (rule.centroid.contains(centroid) && rule.rolloff.contains(rolloff))
            score += rule.spectral_weight;
        if (rule.zcr.contains(zcr))             score += rule.zcr_weight;
        if (rule.bandwidth.contains(bandwidth)) score += rule.bandwidth_weight;
        if (rule.mfcc_std.contains(mfcc_std))   score += rule.mfcc_weight;
        scores[rule.code] = score;
    }
    return scores;
}

float LanguageScorer::confidence_for_score(int score) {
    for (const auto& step : kConfidenceSteps)
        if (score >= step.min_score) return step.confidence;
    return kLowConfidence;
}

LanguageDetectionResult LanguageScorer::fallback() {
    LanguageDetectionResult r;
    r.detected_language = default_language().code;
    r.language_name     = default_language().name;
    r.confidence        = kFallbackConfidence;
    return r;
}

LanguageDetectionResult LanguageScorer::detect(const FeatureVector& features) const {
    if (!features.ok() && features.status() != ExtractionStatus::SILENT) {
        VG_LOG_WARN("Language detection fallback: feature extraction {}",
                    extraction_status_name(features.status()));
        return fallback();
    }

    try {
        std::map<std::string, int> scores = score_table(features);

        // Strict comparison keeps the earliest rule on ties
        const char* best = rules().front().code;
        int best_score = scores[best];
        for (const auto& rule : rules()) {
            if (scores[rule.code] > best_score) {
                best = rule.code;
                best_score = scores[rule.code];
            }
        }

        LanguageDetectionResult r;
        r.confidence = confidence_for_score(best_score);
        r.detected_language = (best_score >= kConfidenceSteps[2].min_score)
                              ? best : default_language().code;
        r.language_name = language_name(r.detected_language.c_str());
        r.has_diagnostics = true;
        r.diagnostics.spectral_centroid  = features.get("spectral_centroid_mean");
        r.diagnostics.spectral_rolloff   = features.get("spectral_rolloff_mean");
        r.diagnostics.spectral_bandwidth = features.get("spectral_bandwidth_mean");
        r.diagnostics.zero_crossing_rate = features.get("zero_crossing_rate_mean");
        r.diagnostics.mfcc_std           = features.get("mfcc13_std");
        r.diagnostics.language_scores    = scores;

        VG_LOG_INFO("Language scores: {}", format_scores(scores));
        VG_LOG_INFO("Detected: {} with confidence: {:.2f}", r.detected_language, r.confidence);
        return r;
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Language detection error: {}", e.what());
        return fallback();
    }
}

} // namespace vg
