#ifndef VOXGUARD_API_H
#define VOXGUARD_API_H

#include <voxguard/voxguard_types.h>

#ifdef _WIN32
    #ifdef VOXGUARD_EXPORTS
        #define VG_API extern "C" __declspec(dllexport)
    #else
        #define VG_API extern "C" __declspec(dllimport)
    #endif
#else
    #define VG_API extern "C" __attribute__((visibility("default")))
#endif

// Error codes. Only API misuse produces an error; any audio content
// (empty, silent, undecodable) yields VG_OK with fallback results.
#define VG_OK                      0
#define VG_ERROR_UNKNOWN          -1
#define VG_ERROR_INVALID_PARAM    -2
#define VG_ERROR_NOT_INIT         -3
#define VG_ERROR_ALREADY_INIT     -4
#define VG_ERROR_BUFFER_TOO_SMALL -5
#define VG_ERROR_WAV_FORMAT       -6  // last-error category only, never returned

/**
 * Fill a configuration structure with defaults
 * (22050 Hz, parallel branches, info logging to "voxguard.log", no model slot).
 */
VG_API void vg_default_config(VgConfig* config);

/**
 * Initialize the SDK.
 * @param config Configuration, or NULL for defaults.
 * @return VG_OK, VG_ERROR_ALREADY_INIT, or VG_ERROR_INVALID_PARAM for a bad config.
 *         A missing model file is not an error: the model slot stays empty.
 */
VG_API int vg_init(const VgConfig* config);

/**
 * Release all resources held by the SDK.
 */
VG_API void vg_release();

/**
 * Full analysis (language + synthetic voice) of PCM audio.
 * @param pcm_data     Float32 mono samples normalized to [-1.0, 1.0] (may be NULL when sample_count is 0)
 * @param sample_count Number of samples (>= 0)
 * @param sample_rate  Rate of pcm_data in Hz; resampled to the analysis rate
 * @param out          Caller-allocated result
 * @return VG_OK for any audio content, error code only for invalid arguments
 */
VG_API int vg_analyze(const float* pcm_data, int sample_count, int sample_rate,
                      VgAnalysisResult* out);

/**
 * Full analysis of a WAV file (PCM8/PCM16/float32, any channel count).
 * An unreadable file still returns VG_OK with fallback results and metadata
 * flags cleared; vg_get_last_error() then describes the decode failure.
 */
VG_API int vg_analyze_file(const char* wav_path, VgAnalysisResult* out);

/**
 * Full analysis of an in-memory WAV byte buffer.
 */
VG_API int vg_analyze_buffer(const void* wav_bytes, int byte_count, VgAnalysisResult* out);

/**
 * Spoken-language identification only.
 */
VG_API int vg_detect_language(const float* pcm_data, int sample_count, int sample_rate,
                              VgLanguageResult* out);
VG_API int vg_detect_language_file(const char* wav_path, VgLanguageResult* out);

/**
 * Synthetic-voice detection only.
 */
VG_API int vg_detect_voice_cloning(const float* pcm_data, int sample_count, int sample_rate,
                                   VgVoiceCloningResult* out);
VG_API int vg_detect_voice_cloning_file(const char* wav_path, VgVoiceCloningResult* out);

/**
 * Render a result as JSON.
 * @param out_len Receives the JSON length (excluding NUL), also when the buffer is too small.
 * @return VG_OK, or VG_ERROR_BUFFER_TOO_SMALL if buf_size <= *out_len.
 */
VG_API int vg_result_to_json(const VgAnalysisResult* result,
                             char* buf, int buf_size, int* out_len);

/**
 * Supported-language table. Does not require vg_init().
 */
VG_API int vg_get_supported_language_count();
VG_API int vg_get_supported_language(int index, VgLanguageInfo* out);
/** @return Code of the default language ("en"). Never NULL. */
VG_API const char* vg_default_language();
/** @return Display name for a code, or the code itself if unsupported. NULL-safe. */
VG_API const char* vg_language_name(const char* lang_code);

/**
 * @return "low", "medium", "high", or "unknown". Never NULL.
 */
VG_API const char* vg_risk_level_name(int risk_level);

/**
 * Get the last error message.
 * @return Error message string (thread-local, valid until next API call)
 */
VG_API const char* vg_get_last_error();

/**
 * @return SDK version string.
 */
VG_API const char* vg_version();

#endif // VOXGUARD_API_H
