#include <voxguard/voxguard_api.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Helper: generate synthetic voiced audio
static std::vector<float> generate_audio(float freq, float duration, int sample_rate = 22050) {
    int num_samples = static_cast<int>(duration * sample_rate);
    std::vector<float> samples(num_samples);
    std::mt19937 rng(static_cast<unsigned>(freq * 1000));
    std::normal_distribution<float> noise(0.0f, 0.05f);

    for (int i = 0; i < num_samples; ++i) {
        float t = static_cast<float>(i) / sample_rate;
        float env = 0.6f + 0.4f * std::sin(2.0f * 3.14159265f * 3.0f * t);
        samples[i] = env * 0.3f * std::sin(2.0f * 3.14159265f * freq * t);
        samples[i] += env * 0.2f * std::sin(2.0f * 3.14159265f * freq * 2 * t);
        samples[i] += noise(rng);
    }
    return samples;
}

// Peak resident set size in MB (Linux only)
static double get_peak_rss_mb() {
#ifdef __linux__
    std::ifstream status("/proc/self/status");
    std::string key;
    while (status >> key) {
        if (key == "VmHWM:") {
            double kb = 0.0;
            status >> kb;
            return kb / 1024.0;
        }
        std::string rest;
        std::getline(status, rest);
    }
#endif
    return -1.0;
}

struct BenchmarkResult {
    std::string name;
    double p50_ms;
    double p95_ms;
    double mean_ms;
    bool passed;
    double target_ms;
};

static BenchmarkResult measure(const std::string& name, const std::vector<float>& audio,
                               int iterations, double target_ms) {
    std::vector<double> times;
    VgAnalysisResult result;
    for (int i = 0; i < iterations; ++i) {
        auto start = std::chrono::high_resolution_clock::now();
        vg_analyze(audio.data(), static_cast<int>(audio.size()), 22050, &result);
        auto end = std::chrono::high_resolution_clock::now();
        times.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }
    std::sort(times.begin(), times.end());

    BenchmarkResult r;
    r.name = name;
    r.p50_ms = times[times.size() / 2];
    r.p95_ms = times[std::min(times.size() - 1, times.size() * 95 / 100)];
    double sum = 0.0;
    for (double t : times) sum += t;
    r.mean_ms = sum / times.size();
    r.target_ms = target_ms;
    r.passed = r.p95_ms < target_ms;

    std::cout << name << ": mean " << r.mean_ms << " ms, P50 " << r.p50_ms
              << " ms, P95 " << r.p95_ms << " ms (target < " << target_ms << " ms) "
              << (r.passed ? "PASS" : "FAIL") << std::endl;
    return r;
}

static void print_report(const std::vector<BenchmarkResult>& results,
                         const std::string& extra_info,
                         const std::string& filename) {
    std::ofstream report(filename);
    report << "=== VoxGuard Benchmark Report ===\n\n";

    for (const auto& r : results) {
        report << r.name << ":\n";
        report << "  Mean: " << r.mean_ms << " ms\n";
        report << "  P50:  " << r.p50_ms << " ms\n";
        report << "  P95:  " << r.p95_ms << " ms\n";
        report << "  Target: " << r.target_ms << " ms\n";
        report << "  Result: " << (r.passed ? "PASS" : "FAIL") << "\n\n";
    }

    if (!extra_info.empty()) {
        report << extra_info;
    }

    std::cout << "\nBenchmark report saved to: " << filename << std::endl;
}

int main(int argc, char* argv[]) {
    int iterations = argc > 1 ? std::max(1, std::atoi(argv[1])) : 10;

    VgConfig config;
    vg_default_config(&config);
    config.log_level = 4;
    config.log_file[0] = '\0';
    if (vg_init(&config) != VG_OK) {
        std::cerr << "Init failed: " << vg_get_last_error() << std::endl;
        return 1;
    }

    std::cout << "=== VoxGuard Benchmark (" << iterations << " iterations) ===" << std::endl;

    std::vector<BenchmarkResult> results;
    results.push_back(measure("Analyze 3s", generate_audio(180.0f, 3.0f), iterations, 1000.0));
    results.push_back(measure("Analyze 10s", generate_audio(180.0f, 10.0f), iterations, 3000.0));
    results.push_back(measure("Analyze 30s", generate_audio(180.0f, 30.0f), iterations, 9000.0));

    std::string extra_info;
    double rss = get_peak_rss_mb();
    if (rss >= 0.0) {
        extra_info = "Peak RSS: " + std::to_string(rss) + " MB\n";
        std::cout << extra_info;
    }

    print_report(results, extra_info, "benchmark_report.txt");
    vg_release();

    bool all_passed = std::all_of(results.begin(), results.end(),
                                  [](const BenchmarkResult& r) { return r.passed; });
    return all_passed ? 0 : 1;
}
