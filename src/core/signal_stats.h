#pragma once
#ifndef VG_SIGNAL_STATS_H
#define VG_SIGNAL_STATS_H

// Frame-level energy measures and distribution statistics.
// All statistics are population statistics accumulated in double precision.

#include <vector>
#include <cmath>
#include <algorithm>
#include <numeric>

namespace vg {
namespace dsp {

// ----------------------------------------------------------------
// Moments of a value distribution (skew / excess kurtosis are the
// biased estimators; both are 0 for a constant distribution)
// ----------------------------------------------------------------
struct Moments {
    double mean     = 0.0;
    double std      = 0.0;
    double min      = 0.0;
    double max      = 0.0;
    double skew     = 0.0;
    double kurtosis = 0.0;
};

inline Moments describe(const float* values, size_t count) {
    Moments m;
    if (!values || count == 0) return m;

    double sum = 0.0;
    double lo = values[0], hi = values[0];
    for (size_t i = 0; i < count; ++i) {
        double v = values[i];
        sum += v;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
    }
    m.mean = sum / count;
    m.min  = lo;
    m.max  = hi;

    double m2 = 0.0, m3 = 0.0, m4 = 0.0;
    for (size_t i = 0; i < count; ++i) {
        double d  = values[i] - m.mean;
        double d2 = d * d;
        m2 += d2;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    m2 /= count;
    m3 /= count;
    m4 /= count;
    m.std = std::sqrt(m2);

    // Relative floor keeps rounding noise of a constant set from producing
    // huge higher moments
    double scale = std::max(std::abs(m.mean), 1.0);
    if (m2 > 1e-24 * scale * scale) {
        m.skew     = m3 / std::pow(m2, 1.5);
        m.kurtosis = m4 / (m2 * m2) - 3.0;
    }
    return m;
}

inline Moments describe(const std::vector<float>& values) {
    return describe(values.data(), values.size());
}

inline double mean_of(const std::vector<float>& values) {
    if (values.empty()) return 0.0;
    double s = 0.0;
    for (float v : values) s += v;
    return s / values.size();
}

inline float peak_amplitude(const std::vector<float>& pcm) {
    float peak = 0.0f;
    for (float x : pcm) peak = std::max(peak, std::abs(x));
    return peak;
}

// ----------------------------------------------------------------
// Frame energies (sum of squares), frames taken from the raw signal
// without padding. Empty when the signal is shorter than one frame.
// ----------------------------------------------------------------
inline std::vector<float> frame_energies(const std::vector<float>& pcm,
                                         int frame_length = 2048, int hop = 512) {
    std::vector<float> energies;
    const int n = static_cast<int>(pcm.size());
    if (frame_length <= 0 || hop <= 0 || n < frame_length) return energies;
    energies.reserve(static_cast<size_t>((n - frame_length) / hop + 1));
    for (int start = 0; start + frame_length <= n; start += hop) {
        double e = 0.0;
        for (int j = start; j < start + frame_length; ++j)
            e += static_cast<double>(pcm[j]) * pcm[j];
        energies.push_back(static_cast<float>(e));
    }
    return energies;
}

// ----------------------------------------------------------------
// Coefficient of variation (std / mean). Returns false when the mean
// is not positive.
// ----------------------------------------------------------------
inline bool coefficient_of_variation(const std::vector<float>& values, double& cv) {
    if (values.empty()) return false;
    Moments m = describe(values);
    if (!(m.mean > 0.0)) return false;
    cv = m.std / m.mean;
    return true;
}

inline bool all_finite(const std::vector<float>& values) {
    for (float v : values)
        if (!std::isfinite(v)) return false;
    return true;
}

} // namespace dsp
} // namespace vg

#endif // VG_SIGNAL_STATS_H
