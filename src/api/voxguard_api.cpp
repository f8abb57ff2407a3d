#include <voxguard/voxguard_api.h>
#include "api/result_json.h"
#include "core/analysis_types.h"
#include "core/enhanced_analyzer.h"
#include "core/language_table.h"
#include "utils/config.h"
#include "utils/error_codes.h"
#include "utils/logger.h"
#include <algorithm>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>

#define VG_VERSION_STRING "1.0.0"

// Global analyzer instance. Analysis calls take a reference under the init
// mutex and then run unlocked, so vg_release() never frees an analyzer that
// is still in use.
static std::shared_ptr<vg::EnhancedAnalyzer> g_analyzer;
static std::mutex g_init_mutex;

namespace {

std::shared_ptr<vg::EnhancedAnalyzer> current_analyzer() {
    std::lock_guard<std::mutex> lock(g_init_mutex);
    return g_analyzer;
}

template <size_t N>
void copy_string(char (&dst)[N], const std::string& src) {
    size_t n = std::min(src.size(), N - 1);
    std::memcpy(dst, src.data(), n);
    dst[n] = '\0';
}

// Bounded copy of a fixed-size, possibly unterminated C field
template <size_t N>
std::string field_string(const char (&src)[N]) {
    return std::string(src, strnlen(src, N));
}

void fill_language(const vg::LanguageDetectionResult& in, VgLanguageResult* out) {
    std::memset(out, 0, sizeof(*out));
    copy_string(out->detected_language, in.detected_language);
    copy_string(out->language_name, in.language_name);
    copy_string(out->transcription, in.transcription);
    out->confidence = in.confidence;
    out->has_features = in.has_diagnostics ? 1 : 0;
    if (!in.has_diagnostics) return;

    const vg::LanguageDiagnostics& d = in.diagnostics;
    out->features.spectral_centroid  = d.spectral_centroid;
    out->features.spectral_rolloff   = d.spectral_rolloff;
    out->features.spectral_bandwidth = d.spectral_bandwidth;
    out->features.zero_crossing_rate = d.zero_crossing_rate;
    out->features.mfcc_std           = d.mfcc_std;
    for (const auto& entry : d.language_scores) {
        int index = vg::language_index(entry.first);
        if (index >= 0 && index < VG_LANGUAGE_COUNT)
            out->features.language_scores[index] = entry.second;
    }
}

void fill_voice_cloning(const vg::VoiceCloningDetectionResult& in, VgVoiceCloningResult* out) {
    std::memset(out, 0, sizeof(*out));
    out->is_ai_generated  = in.is_ai_generated ? 1 : 0;
    out->confidence_score = in.confidence_score;
    out->risk_level       = static_cast<int>(in.risk_level);
    copy_string(out->detection_method, in.detection_method);
    out->heuristic_score  = in.component_scores.heuristic;
    out->pattern_score    = in.component_scores.pattern;
    out->temporal_score   = in.component_scores.temporal;
    out->model_score      = in.model_score;

    int count = 0;
    for (const auto& name : in.indicators) {
        if (count >= VG_MAX_INDICATORS) break;
        copy_string(out->indicators[count], name);
        ++count;
    }
    out->indicator_count = count;
}

void fill_result(const vg::EnhancedAnalysisResult& in, VgAnalysisResult* out) {
    std::memset(out, 0, sizeof(*out));
    fill_language(in.language, &out->language);
    fill_voice_cloning(in.voice_cloning, &out->voice_cloning);
    out->metadata.multilingual_support = in.metadata.multilingual_support ? 1 : 0;
    out->metadata.ai_detection_enabled = in.metadata.ai_detection_enabled ? 1 : 0;
    copy_string(out->metadata.detection_version, in.metadata.detection_version);
    copy_string(out->metadata.analysis_timestamp, in.metadata.analysis_timestamp);
}

// Validation shared by the PCM entry points
bool valid_pcm_args(const float* pcm_data, int sample_count, int sample_rate, const void* out) {
    if (!out || sample_count < 0 || sample_rate <= 0 || (sample_count > 0 && !pcm_data)) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM,
                           "out must not be null, sample_count >= 0, sample_rate > 0");
        return false;
    }
    return true;
}

vg::Waveform make_waveform(const float* pcm_data, int sample_count, int sample_rate) {
    vg::Waveform wav;
    wav.sample_rate = sample_rate;
    if (sample_count > 0) wav.samples.assign(pcm_data, pcm_data + sample_count);
    return wav;
}

} // anonymous namespace

// ============================================================
// Lifecycle
// ============================================================
VG_API void vg_default_config(VgConfig* config) {
    if (!config) return;
    std::memset(config, 0, sizeof(*config));
    config->target_sample_rate = VG_TARGET_SAMPLE_RATE;
    config->parallel = 1;
    config->log_level = 2;
    copy_string(config->log_file, "voxguard.log");
}

VG_API int vg_init(const VgConfig* config) {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_analyzer) {
        vg::set_last_error(vg::ErrorCode::ALREADY_INIT);
        return VG_ERROR_ALREADY_INIT;
    }

    VgConfig cfg;
    if (config) {
        cfg = *config;
    } else {
        vg_default_config(&cfg);
    }

    if (cfg.target_sample_rate < 8000 || cfg.target_sample_rate > 192000) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM,
                           "target_sample_rate must be within [8000, 192000]");
        return VG_ERROR_INVALID_PARAM;
    }
    if (cfg.log_level < 0 || cfg.log_level > 6) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM, "log_level must be within [0, 6]");
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        vg::AnalyzerConfig acfg;
        acfg.target_sample_rate = cfg.target_sample_rate;
        acfg.parallel  = cfg.parallel != 0;
        acfg.log_level = cfg.log_level;
        acfg.log_file  = field_string(cfg.log_file);
        acfg.model_dir = field_string(cfg.model_dir);

        vg::Logger::instance().init(acfg.log_file,
                                    static_cast<spdlog::level::level_enum>(acfg.log_level));
        VG_LOG_INFO("Initializing VoxGuard SDK v{}", VG_VERSION_STRING);

        auto analyzer = std::make_shared<vg::EnhancedAnalyzer>(acfg);
        if (!acfg.model_dir.empty() && !analyzer->load_model()) {
            VG_LOG_WARN("No model loaded from {}, heuristic detection only", acfg.model_dir);
        }
        g_analyzer = std::move(analyzer);

        vg::clear_last_error();
        VG_LOG_INFO("VoxGuard SDK initialized successfully");
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        g_analyzer.reset();
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        g_analyzer.reset();
        return VG_ERROR_UNKNOWN;
    }
}

VG_API void vg_release() {
    std::lock_guard<std::mutex> lock(g_init_mutex);

    if (g_analyzer) {
        g_analyzer.reset();
        VG_LOG_INFO("VoxGuard SDK released");
    }

    vg::Logger::instance().shutdown();
}

// ============================================================
// Full analysis
// ============================================================
VG_API int vg_analyze(const float* pcm_data, int sample_count, int sample_rate,
                      VgAnalysisResult* out) {
    auto analyzer = current_analyzer();
    if (!analyzer) {
        vg::set_last_error(vg::ErrorCode::NOT_INIT);
        return VG_ERROR_NOT_INIT;
    }
    if (!valid_pcm_args(pcm_data, sample_count, sample_rate, out)) {
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        vg::EnhancedAnalysisResult result =
            analyzer->analyze(make_waveform(pcm_data, sample_count, sample_rate));
        fill_result(result, out);
        vg::clear_last_error();
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

VG_API int vg_analyze_file(const char* wav_path, VgAnalysisResult* out) {
    auto analyzer = current_analyzer();
    if (!analyzer) {
        vg::set_last_error(vg::ErrorCode::NOT_INIT);
        return VG_ERROR_NOT_INIT;
    }
    if (!wav_path || !out) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM);
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        std::string decode_error;
        vg::EnhancedAnalysisResult result = analyzer->analyze_file(wav_path, &decode_error);
        fill_result(result, out);
        if (decode_error.empty()) {
            vg::clear_last_error();
        } else {
            vg::set_last_error(vg::ErrorCode::WAV_FORMAT, decode_error);
        }
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

VG_API int vg_analyze_buffer(const void* wav_bytes, int byte_count, VgAnalysisResult* out) {
    auto analyzer = current_analyzer();
    if (!analyzer) {
        vg::set_last_error(vg::ErrorCode::NOT_INIT);
        return VG_ERROR_NOT_INIT;
    }
    if (!out || byte_count < 0 || (byte_count > 0 && !wav_bytes)) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM);
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        std::string decode_error;
        vg::EnhancedAnalysisResult result = analyzer->analyze_buffer(
            wav_bytes, static_cast<size_t>(byte_count), &decode_error);
        fill_result(result, out);
        if (decode_error.empty()) {
            vg::clear_last_error();
        } else {
            vg::set_last_error(vg::ErrorCode::WAV_FORMAT, decode_error);
        }
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

// ============================================================
// Single-branch analysis
// ============================================================
VG_API int vg_detect_language(const float* pcm_data, int sample_count, int sample_rate,
                              VgLanguageResult* out) {
    auto analyzer = current_analyzer();
    if (!analyzer) {
        vg::set_last_error(vg::ErrorCode::NOT_INIT);
        return VG_ERROR_NOT_INIT;
    }
    if (!valid_pcm_args(pcm_data, sample_count, sample_rate, out)) {
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        fill_language(analyzer->detect_language(
                          make_waveform(pcm_data, sample_count, sample_rate)), out);
        vg::clear_last_error();
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

VG_API int vg_detect_language_file(const char* wav_path, VgLanguageResult* out) {
    auto analyzer = current_analyzer();
    if (!analyzer) {
        vg::set_last_error(vg::ErrorCode::NOT_INIT);
        return VG_ERROR_NOT_INIT;
    }
    if (!wav_path || !out) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM);
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        vg::Waveform wav;
        std::string error;
        if (!analyzer->load_waveform(wav_path, wav, error)) {
            VG_LOG_ERROR("Cannot decode {}: {}", wav_path, error);
            fill_language(vg::LanguageDetectionResult(), out);
            vg::set_last_error(vg::ErrorCode::WAV_FORMAT, error);
            return VG_OK;
        }
        fill_language(analyzer->detect_language(wav), out);
        vg::clear_last_error();
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

VG_API int vg_detect_voice_cloning(const float* pcm_data, int sample_count, int sample_rate,
                                   VgVoiceCloningResult* out) {
    auto analyzer = current_analyzer();
    if (!analyzer) {
        vg::set_last_error(vg::ErrorCode::NOT_INIT);
        return VG_ERROR_NOT_INIT;
    }
    if (!valid_pcm_args(pcm_data, sample_count, sample_rate, out)) {
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        fill_voice_cloning(analyzer->detect_voice_cloning(
                               make_waveform(pcm_data, sample_count, sample_rate)), out);
        vg::clear_last_error();
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

VG_API int vg_detect_voice_cloning_file(const char* wav_path, VgVoiceCloningResult* out) {
    auto analyzer = current_analyzer();
    if (!analyzer) {
        vg::set_last_error(vg::ErrorCode::NOT_INIT);
        return VG_ERROR_NOT_INIT;
    }
    if (!wav_path || !out) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM);
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        vg::Waveform wav;
        std::string error;
        if (!analyzer->load_waveform(wav_path, wav, error)) {
            VG_LOG_ERROR("Cannot decode {}: {}", wav_path, error);
            fill_voice_cloning(vg::VoiceCloningDetectionResult(), out);
            vg::set_last_error(vg::ErrorCode::WAV_FORMAT, error);
            return VG_OK;
        }
        fill_voice_cloning(analyzer->detect_voice_cloning(wav), out);
        vg::clear_last_error();
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

// ============================================================
// Rendering and static tables
// ============================================================
VG_API int vg_result_to_json(const VgAnalysisResult* result,
                             char* buf, int buf_size, int* out_len) {
    if (!result || buf_size < 0) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM);
        return VG_ERROR_INVALID_PARAM;
    }

    try {
        std::string json = vg::result_to_json(*result);
        int len = static_cast<int>(json.size());
        if (out_len) *out_len = len;
        if (!buf || buf_size <= len) {
            vg::set_last_error(vg::ErrorCode::BUFFER_TOO_SMALL,
                               "need " + std::to_string(len + 1) + " bytes");
            return VG_ERROR_BUFFER_TOO_SMALL;
        }
        std::memcpy(buf, json.data(), json.size());
        buf[len] = '\0';
        vg::clear_last_error();
        return VG_OK;
    } catch (const std::exception& e) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN, e.what());
        return VG_ERROR_UNKNOWN;
    } catch (...) {
        vg::set_last_error(vg::ErrorCode::UNKNOWN);
        return VG_ERROR_UNKNOWN;
    }
}

VG_API int vg_get_supported_language_count() {
    return static_cast<int>(vg::supported_languages().size());
}

VG_API int vg_get_supported_language(int index, VgLanguageInfo* out) {
    const auto& table = vg::supported_languages();
    if (!out || index < 0 || index >= static_cast<int>(table.size())) {
        vg::set_last_error(vg::ErrorCode::INVALID_PARAM, "language index out of range");
        return VG_ERROR_INVALID_PARAM;
    }
    std::memset(out, 0, sizeof(*out));
    copy_string(out->code, table[index].code);
    copy_string(out->name, table[index].name);
    out->is_default = table[index].is_default ? 1 : 0;
    return VG_OK;
}

VG_API const char* vg_default_language() {
    return vg::default_language().code;
}

VG_API const char* vg_language_name(const char* lang_code) {
    return vg::language_name(lang_code);
}

VG_API const char* vg_risk_level_name(int risk_level) {
    return vg::risk_level_name(static_cast<vg::RiskLevel>(risk_level));
}

VG_API const char* vg_get_last_error() {
    return vg::get_last_error();
}

VG_API const char* vg_version() {
    return VG_VERSION_STRING;
}
