#ifndef VG_ERROR_CODES_H
#define VG_ERROR_CODES_H

#include <string>

namespace vg {

enum class ErrorCode {
    OK = 0,
    UNKNOWN = -1,
    INVALID_PARAM = -2,
    NOT_INIT = -3,
    ALREADY_INIT = -4,
    BUFFER_TOO_SMALL = -5,
    WAV_FORMAT = -6
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "Success";
        case ErrorCode::UNKNOWN: return "Unknown error";
        case ErrorCode::INVALID_PARAM: return "Invalid parameter";
        case ErrorCode::NOT_INIT: return "SDK not initialized";
        case ErrorCode::ALREADY_INIT: return "SDK already initialized";
        case ErrorCode::BUFFER_TOO_SMALL: return "Output buffer too small";
        case ErrorCode::WAV_FORMAT: return "Invalid WAV format";
        default: return "Unknown error code";
    }
}

// Thread-local error message storage
inline thread_local std::string g_last_error;

inline void set_last_error(const std::string& msg) {
    g_last_error = msg;
}

inline void set_last_error(ErrorCode code) {
    g_last_error = error_code_to_string(code);
}

inline void set_last_error(ErrorCode code, const std::string& detail) {
    g_last_error = std::string(error_code_to_string(code)) + ": " + detail;
}

inline void clear_last_error() {
    g_last_error.clear();
}

inline const char* get_last_error() {
    return g_last_error.c_str();
}

} // namespace vg

#endif // VG_ERROR_CODES_H
