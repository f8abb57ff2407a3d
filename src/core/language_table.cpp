#include "core/language_table.h"
#include <cstring>

namespace vg {

const std::vector<LanguageInfo>& supported_languages() {
    static const std::vector<LanguageInfo> kLanguages = {
        {"en", "English", true},
        {"hi", "Hindi",   false},
        {"kn", "Kannada", false},
        {"te", "Telugu",  false},
    };
    return kLanguages;
}

const LanguageInfo& default_language() {
    return supported_languages().front();
}

int language_index(const std::string& code) {
    const auto& langs = supported_languages();
    for (size_t i = 0; i < langs.size(); ++i)
        if (code == langs[i].code) return static_cast<int>(i);
    return -1;
}

const char* language_name(const char* code) {
    if (!code) return "Unknown";
    for (const auto& lang : supported_languages())
        if (std::strcmp(code, lang.code) == 0) return lang.name;
    return code;
}

} // namespace vg
