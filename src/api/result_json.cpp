#include "api/result_json.h"
#include "core/analysis_types.h"
#include "core/language_table.h"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <cstring>

namespace vg {

namespace {

// JSON has no NaN / Inf
std::string json_number(float v) {
    if (!std::isfinite(v)) return "null";
    return fmt::format("{}", v);
}

const char* json_bool(int v) { return v ? "true" : "false"; }

// Fixed-size C fields end at the first NUL or at the array end
template <size_t N>
std::string json_field(const char (&field)[N]) {
    return json_string(field, N);
}

template <size_t N>
std::string field_text(const char (&field)[N]) {
    return std::string(field, strnlen(field, N));
}

} // anonymous namespace

std::string json_string(const char* text, size_t max_len) {
    std::string out = "\"";
    if (text) {
        for (size_t i = 0; i < max_len && text[i]; ++i) {
            unsigned char c = static_cast<unsigned char>(text[i]);
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n";  break;
                case '\r': out += "\\r";  break;
                case '\t': out += "\\t";  break;
                default:
                    if (c < 0x20) out += fmt::format("\\u{:04x}", c);
                    else          out += static_cast<char>(c);
            }
        }
    }
    out += "\"";
    return out;
}

std::string language_to_json(const VgLanguageResult& lang) {
    std::string s = fmt::format(
        "{{\"detected_language\":{},\"confidence\":{},\"language_name\":{},"
        "\"language_code\":{},\"transcription\":{}",
        json_field(lang.detected_language), json_number(lang.confidence),
        json_field(lang.language_name), json_field(lang.detected_language),
        json_field(lang.transcription));

    if (lang.has_features) {
        const VgLanguageFeatures& f = lang.features;
        const auto& table = supported_languages();
        std::string scores;
        for (size_t i = 0; i < table.size() && i < VG_LANGUAGE_COUNT; ++i) {
            if (i > 0) scores += ",";
            scores += fmt::format("{}:{}", json_string(table[i].code), f.language_scores[i]);
        }
        s += fmt::format(
            ",\"detection_features\":{{\"spectral_centroid\":{},\"spectral_rolloff\":{},"
            "\"spectral_bandwidth\":{},\"zero_crossing_rate\":{},\"mfcc_std\":{},"
            "\"language_scores\":{{{}}}}}",
            json_number(f.spectral_centroid), json_number(f.spectral_rolloff),
            json_number(f.spectral_bandwidth), json_number(f.zero_crossing_rate),
            json_number(f.mfcc_std), scores);
    }
    s += "}";
    return s;
}

std::string voice_cloning_to_json(const VgVoiceCloningResult& vc) {
    std::string s = fmt::format(
        "{{\"is_ai_generated\":{},\"confidence_score\":{},\"detection_method\":{},"
        "\"risk_level\":{}",
        json_bool(vc.is_ai_generated), json_number(vc.confidence_score),
        json_field(vc.detection_method), json_string(risk_level_name(static_cast<RiskLevel>(vc.risk_level))));

    // The error fallback carries no component breakdown
    if (field_text(vc.detection_method) != "error") {
        std::string indicators;
        int count = vc.indicator_count < 0 ? 0
                  : (vc.indicator_count > VG_MAX_INDICATORS ? VG_MAX_INDICATORS
                                                            : vc.indicator_count);
        for (int i = 0; i < count; ++i) {
            if (i > 0) indicators += ",";
            indicators += json_field(vc.indicators[i]);
        }
        s += fmt::format(
            ",\"component_scores\":{{\"heuristic\":{},\"pattern\":{},\"temporal\":{}}},"
            "\"indicators\":[{}]",
            json_number(vc.heuristic_score), json_number(vc.pattern_score),
            json_number(vc.temporal_score), indicators);
        if (vc.model_score >= 0.0f) {
            s += fmt::format(",\"model_score\":{}", json_number(vc.model_score));
        }
    }
    s += "}";
    return s;
}

std::string result_to_json(const VgAnalysisResult& r) {
    const VgAnalysisMetadata& m = r.metadata;
    return fmt::format(
        "{{\"language_detection\":{},\"voice_cloning_detection\":{},"
        "\"enhanced_analysis\":{{\"multilingual_support\":{},\"ai_detection_enabled\":{},"
        "\"detection_version\":{},\"analysis_timestamp\":{}}}}}",
        language_to_json(r.language), voice_cloning_to_json(r.voice_cloning),
        json_bool(m.multilingual_support), json_bool(m.ai_detection_enabled),
        json_field(m.detection_version), json_field(m.analysis_timestamp));
}

} // namespace vg
