#ifndef VG_CONFIG_H
#define VG_CONFIG_H

#include <string>

namespace vg {

// Internal form of VgConfig
struct AnalyzerConfig {
    int         target_sample_rate = 22050;
    bool        parallel           = true;
    int         log_level          = 2;   // spdlog level number (info)
    std::string log_file           = "voxguard.log";
    std::string model_dir;                // empty: no model slot
};

} // namespace vg

#endif // VG_CONFIG_H
