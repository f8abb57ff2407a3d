#pragma once
#ifndef VG_PITCH_TRACKER_H
#define VG_PITCH_TRACKER_H

// Fundamental frequency tracking with YIN.
// Reference: de Cheveigné & Kawahara (2002), JASA 111(4).

#include <vector>
#include <cmath>
#include <algorithm>

namespace vg {
namespace dsp {

struct YinOptions {
    int   sample_rate        = 22050;
    float min_f0_hz          = 60.0f;
    float max_f0_hz          = 600.0f;
    float threshold          = 0.15f;  // absolute CMNDF threshold
    float fallback_threshold = 0.35f;  // accept the global minimum below this
    float hop_seconds        = 0.01f;
};

// F0 per hop (0 = unvoiced) plus statistics over the voiced hops.
struct PitchTrack {
    std::vector<float> f0_hz;
    int   voiced_frames = 0;
    float mean_f0_hz    = 0.0f;
    float std_f0_hz     = 0.0f;
};

inline int yin_min_lag(const YinOptions& o) {
    return std::max(2, static_cast<int>(o.sample_rate / o.max_f0_hz));
}

inline int yin_max_lag(const YinOptions& o) {
    return static_cast<int>(o.sample_rate / o.min_f0_hz);
}

// Analysis window: two periods of the lowest admissible F0.
inline int yin_window_length(const YinOptions& o) {
    return 2 * yin_max_lag(o);
}

namespace detail {

// Cumulative mean normalised difference d'(tau) for tau in [0, max_lag].
// The squared-difference sum runs over a window of fixed length so every lag
// sees the same number of terms.
inline std::vector<double> cmndf(const float* x, int n, int max_lag) {
    const int span = n - max_lag;
    std::vector<double> d(max_lag + 1, 1.0);
    double cumulative = 0.0;
    for (int tau = 1; tau <= max_lag; ++tau) {
        double acc = 0.0;
        for (int j = 0; j < span; ++j) {
            const double diff = static_cast<double>(x[j]) - x[j + tau];
            acc += diff * diff;
        }
        cumulative += acc;
        d[tau] = cumulative > 0.0 ? acc * tau / cumulative : 1.0;
    }
    return d;
}

// Period in samples, or 0 when the window is unvoiced.
inline int pick_period(const std::vector<double>& d, int min_lag, const YinOptions& o) {
    const int max_lag = static_cast<int>(d.size()) - 1;
    for (int tau = min_lag; tau <= max_lag; ++tau) {
        if (d[tau] >= o.threshold) continue;
        while (tau < max_lag && d[tau + 1] < d[tau]) ++tau;
        return tau;
    }
    auto it = std::min_element(d.begin() + min_lag, d.end());
    if (it != d.end() && *it < o.fallback_threshold)
        return static_cast<int>(it - d.begin());
    return 0;
}

} // namespace detail

inline PitchTrack track_pitch(const std::vector<float>& pcm, const YinOptions& o = YinOptions()) {
    PitchTrack track;
    const int window  = yin_window_length(o);
    const int min_lag = yin_min_lag(o);
    const int max_lag = std::min(yin_max_lag(o), window / 2);
    const int hop     = std::max(1, static_cast<int>(o.sample_rate * o.hop_seconds));
    const int n       = static_cast<int>(pcm.size());
    if (n < window || min_lag > max_lag) return track;

    double sum = 0.0;
    for (int start = 0; start + window <= n; start += hop) {
        auto d = detail::cmndf(pcm.data() + start, window, max_lag);
        const int period = detail::pick_period(d, min_lag, o);
        float f0 = period > 0 ? static_cast<float>(o.sample_rate) / period : 0.0f;
        if (f0 < o.min_f0_hz || f0 > o.max_f0_hz) f0 = 0.0f;
        track.f0_hz.push_back(f0);
        if (f0 > 0.0f) {
            ++track.voiced_frames;
            sum += f0;
        }
    }

    if (track.voiced_frames > 0) {
        const double mean = sum / track.voiced_frames;
        double var = 0.0;
        for (float f0 : track.f0_hz)
            if (f0 > 0.0f) var += (f0 - mean) * (f0 - mean);
        track.mean_f0_hz = static_cast<float>(mean);
        track.std_f0_hz  = static_cast<float>(std::sqrt(var / track.voiced_frames));
    }
    return track;
}

} // namespace dsp
} // namespace vg

#endif // VG_PITCH_TRACKER_H
