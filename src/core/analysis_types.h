#ifndef VG_ANALYSIS_TYPES_H
#define VG_ANALYSIS_TYPES_H

#include <map>
#include <string>
#include <vector>

namespace vg {

enum class RiskLevel {
    LOW    = 0,
    MEDIUM = 1,
    HIGH   = 2
};

const char* risk_level_name(RiskLevel level);

// Measurements the language decision was based on
struct LanguageDiagnostics {
    float spectral_centroid  = 0.0f;
    float spectral_rolloff   = 0.0f;
    float spectral_bandwidth = 0.0f;
    float zero_crossing_rate = 0.0f;
    float mfcc_std           = 0.0f;
    std::map<std::string, int> language_scores;   // every supported code present
};

struct LanguageDetectionResult {
    std::string detected_language = "en";
    float       confidence        = 0.1f;
    std::string language_name     = "English";
    std::string transcription;                     // no speech-to-text stage
    bool        has_diagnostics   = false;
    LanguageDiagnostics diagnostics;
};

struct ComponentScores {
    float heuristic = 0.0f;
    float pattern   = 0.0f;
    float temporal  = 0.0f;
};

struct VoiceCloningDetectionResult {
    bool        is_ai_generated  = false;
    float       confidence_score = 0.0f;
    RiskLevel   risk_level       = RiskLevel::LOW;
    std::string detection_method = "error";
    bool        has_component_scores = false;
    ComponentScores component_scores;
    std::vector<std::string> indicators;
    float       model_score      = -1.0f;          // -1: no model loaded
};

struct AnalysisMetadata {
    bool        multilingual_support = true;
    bool        ai_detection_enabled = true;
    std::string detection_version    = "2.0_advanced";
    std::string analysis_timestamp;                // UTC ISO-8601
};

struct EnhancedAnalysisResult {
    LanguageDetectionResult     language;
    VoiceCloningDetectionResult voice_cloning;
    AnalysisMetadata            metadata;
};

} // namespace vg

#endif // VG_ANALYSIS_TYPES_H
