#include <voxguard/voxguard_api.h>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

// Generate a simple sine wave for testing
static std::vector<float> generate_sine_wave(float freq, float duration, int sample_rate = 22050) {
    int num_samples = static_cast<int>(duration * sample_rate);
    std::vector<float> samples(num_samples);
    for (int i = 0; i < num_samples; ++i) {
        samples[i] = 0.5f * std::sin(2.0f * 3.14159265f * freq * i / sample_rate);
    }
    return samples;
}

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options] [file.wav ...]\n"
              << "  --model-dir DIR   directory holding voice_cloning.onnx\n"
              << "  --sequential      run the two detection branches one after the other\n"
              << "  --log-level N     0=trace .. 6=off (default 3)\n"
              << "Without files a 3 second 440 Hz test tone is analysed.\n";
}

static bool print_json(const VgAnalysisResult& result) {
    int len = 0;
    vg_result_to_json(&result, nullptr, 0, &len);
    std::vector<char> buf(static_cast<size_t>(len) + 1);
    if (vg_result_to_json(&result, buf.data(), len + 1, &len) != VG_OK) {
        std::cerr << "JSON rendering failed: " << vg_get_last_error() << std::endl;
        return false;
    }
    std::cout << buf.data() << std::endl;
    return true;
}

int main(int argc, char* argv[]) {
    VgConfig config;
    vg_default_config(&config);
    config.log_level = 3;
    config.log_file[0] = '\0';

    std::vector<std::string> files;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--model-dir" && i + 1 < argc) {
            std::strncpy(config.model_dir, argv[++i], sizeof(config.model_dir) - 1);
        } else if (arg == "--sequential") {
            config.parallel = 0;
        } else if (arg == "--log-level" && i + 1 < argc) {
            config.log_level = std::atoi(argv[++i]);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            files.push_back(arg);
        }
    }

    std::cerr << "=== VoxGuard " << vg_version() << " ===" << std::endl;

    int ret = vg_init(&config);
    if (ret != VG_OK) {
        std::cerr << "Init failed: " << vg_get_last_error() << std::endl;
        return 1;
    }

    std::cerr << "Supported languages:";
    for (int i = 0; i < vg_get_supported_language_count(); ++i) {
        VgLanguageInfo info;
        if (vg_get_supported_language(i, &info) == VG_OK)
            std::cerr << " " << info.code << " (" << info.name << ")";
    }
    std::cerr << std::endl;

    int exit_code = 0;
    if (files.empty()) {
        auto tone = generate_sine_wave(440.0f, 3.0f);
        VgAnalysisResult result;
        ret = vg_analyze(tone.data(), static_cast<int>(tone.size()), 22050, &result);
        if (ret != VG_OK || !print_json(result)) {
            std::cerr << "Analysis failed: " << vg_get_last_error() << std::endl;
            exit_code = 1;
        }
    }

    for (const auto& path : files) {
        VgAnalysisResult result;
        ret = vg_analyze_file(path.c_str(), &result);
        if (ret != VG_OK) {
            std::cerr << path << ": analysis failed: " << vg_get_last_error() << std::endl;
            exit_code = 1;
            continue;
        }
        if (!result.metadata.ai_detection_enabled) {
            std::cerr << path << ": " << vg_get_last_error() << std::endl;
        }
        std::cerr << path << ": " << result.language.language_name
                  << " (" << result.language.confidence << "), synthetic voice risk "
                  << vg_risk_level_name(result.voice_cloning.risk_level) << std::endl;
        if (!print_json(result)) exit_code = 1;
    }

    vg_release();
    return exit_code;
}
