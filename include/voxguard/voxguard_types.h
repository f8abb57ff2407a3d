#ifndef VOXGUARD_TYPES_H
#define VOXGUARD_TYPES_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================
// Supported languages (static table, see vg_get_supported_language)
// ============================================================
#define VG_LANGUAGE_COUNT        4
#define VG_DEFAULT_LANGUAGE      "en"

// ============================================================
// Risk tiers for synthetic-voice detection
// ============================================================
#define VG_RISK_LOW      0
#define VG_RISK_MEDIUM   1
#define VG_RISK_HIGH     2

// ============================================================
// Defaults
// ============================================================
#define VG_TARGET_SAMPLE_RATE    22050
#define VG_DETECTION_VERSION     "2.0_advanced"
#define VG_MAX_INDICATORS        24

// ============================================================
// Configuration (filled by vg_default_config, passed to vg_init)
// ============================================================
typedef struct VgConfig {
    int  target_sample_rate; /**< analysis rate in Hz (default 22050) */
    int  parallel;           /**< 1 = run language and AI-voice branches concurrently */
    int  log_level;          /**< 0=trace 1=debug 2=info 3=warn 4=error 5=critical 6=off */
    char log_file[260];      /**< rotating log file; empty = console only */
    char model_dir[260];     /**< directory holding voice_cloning.onnx; empty = no model slot */
    int  reserved[4];
} VgConfig;

// ============================================================
// Result structures (all POD / C-compatible)
// ============================================================

/** One entry of the supported-language table */
typedef struct VgLanguageInfo {
    char code[16];       /**< ISO 639-1 code, e.g. "kn" */
    char name[64];       /**< Display name, e.g. "Kannada" */
    int  is_default;     /**< 1 for the default (fallback) language */
} VgLanguageInfo;

/** Acoustic measurements the language decision was based on */
typedef struct VgLanguageFeatures {
    float spectral_centroid;   /**< mean spectral centroid in Hz */
    float spectral_rolloff;    /**< mean 85% roll-off frequency in Hz */
    float spectral_bandwidth;  /**< mean spectral bandwidth in Hz */
    float zero_crossing_rate;  /**< mean zero-crossing rate [0,1] */
    float mfcc_std;            /**< std of 13 cepstral coefficients over all frames */
    int   language_scores[VG_LANGUAGE_COUNT]; /**< accumulated score, table order */
} VgLanguageFeatures;

/** Spoken-language identification result */
typedef struct VgLanguageResult {
    char  detected_language[16]; /**< ISO 639-1 code */
    char  language_name[64];     /**< Human readable name */
    float confidence;            /**< one of 0.85/0.70/0.55/0.40, or 0.10 on extraction failure */
    char  transcription[256];    /**< always empty: no speech-to-text stage */
    int   has_features;          /**< 1 when `features` holds real measurements */
    VgLanguageFeatures features;
    int   reserved[2];
} VgLanguageResult;

/** Synthetic ("AI-cloned") voice detection result */
typedef struct VgVoiceCloningResult {
    int   is_ai_generated;    /**< 1 when confidence_score > 0.65 */
    float confidence_score;   /**< fused score [0,1] */
    int   risk_level;         /**< VG_RISK_* */
    char  detection_method[32]; /**< "advanced_multi_method" or "error" */
    float heuristic_score;    /**< statistical-consistency sub-score [0,1] */
    float pattern_score;      /**< frame energy / pitch stability sub-score [0,1] */
    float temporal_score;     /**< cross-segment similarity sub-score [0,1] */
    float model_score;        /**< optional model probability, -1 when no model is loaded */
    int   indicator_count;    /**< number of entries used in `indicators` */
    char  indicators[VG_MAX_INDICATORS][48]; /**< indicator names raised by the sub-scorers */
    int   reserved[2];
} VgVoiceCloningResult;

/** Static analysis metadata */
typedef struct VgAnalysisMetadata {
    int  multilingual_support;  /**< 0 when the input could not be decoded */
    int  ai_detection_enabled;  /**< 0 when the input could not be decoded */
    char detection_version[32]; /**< VG_DETECTION_VERSION */
    char analysis_timestamp[32]; /**< UTC, ISO-8601 */
} VgAnalysisMetadata;

/** Aggregated result from vg_analyze() */
typedef struct VgAnalysisResult {
    VgLanguageResult     language;
    VgVoiceCloningResult voice_cloning;
    VgAnalysisMetadata   metadata;
    int                  reserved[4];
} VgAnalysisResult;

#ifdef __cplusplus
} // extern "C"
#endif

#endif // VOXGUARD_TYPES_H
