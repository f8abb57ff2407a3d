#ifndef VG_LANGUAGE_TABLE_H
#define VG_LANGUAGE_TABLE_H

#include <string>
#include <vector>

namespace vg {

struct LanguageInfo {
    const char* code;   // ISO 639-1
    const char* name;
    bool is_default;
};

// Static, read-only table of supported languages: en (default), hi, kn, te
const std::vector<LanguageInfo>& supported_languages();

const LanguageInfo& default_language();

// Index in supported_languages(), or -1
int language_index(const std::string& code);

// Display name for a code; the code itself when unsupported
const char* language_name(const char* code);

} // namespace vg

#endif // VG_LANGUAGE_TABLE_H
