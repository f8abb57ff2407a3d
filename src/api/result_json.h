#ifndef VG_RESULT_JSON_H
#define VG_RESULT_JSON_H

#include <voxguard/voxguard_types.h>
#include <cstddef>
#include <cstdint>
#include <string>

namespace vg {

// JSON rendering of an analysis result:
// {"language_detection": {...}, "voice_cloning_detection": {...},
//  "enhanced_analysis": {...}}
std::string result_to_json(const VgAnalysisResult& result);

std::string language_to_json(const VgLanguageResult& language);
std::string voice_cloning_to_json(const VgVoiceCloningResult& voice_cloning);

// Quote and escape a string for JSON output, reading at most max_len bytes
std::string json_string(const char* text, size_t max_len = SIZE_MAX);

} // namespace vg

#endif // VG_RESULT_JSON_H
