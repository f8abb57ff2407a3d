#include "core/spectral_analyzer.h"
#include "kaldi-native-fbank/csrc/rfft.h"
#include <cmath>
#include <cfloat>
#include <algorithm>
#include <stdexcept>

namespace vg {

namespace {

constexpr double kPi          = 3.14159265358979323846;
constexpr double kRollPercent = 0.85;
constexpr double kPowerFloor  = 1e-10;
constexpr double kContrastFmin     = 200.0;
constexpr double kContrastQuantile = 0.02;
constexpr double kTopDb       = 80.0;

// 10*log10 with floor, then clipped to `top_db` below the array maximum
void power_to_db(std::vector<double>& values) {
    if (values.empty()) return;
    double max_db = -1e300;
    for (auto& v : values) {
        v = 10.0 * std::log10(std::max(kPowerFloor, v));
        max_db = std::max(max_db, v);
    }
    for (auto& v : values) v = std::max(v, max_db - kTopDb);
}

// Sign test for zero crossings; magnitudes at or below 1e-10 count as zero (positive)
inline bool is_negative(float x) {
    return x < -1e-10f;
}

// Tonal centroid basis: fifths, minor thirds, major thirds
void tonnetz_basis(double phi[6][12]) {
    const double scale[6] = {7.0 / 6, 7.0 / 6, 3.0 / 2, 3.0 / 2, 2.0 / 3, 2.0 / 3};
    const double radius[6] = {1.0, 1.0, 1.0, 1.0, 0.5, 0.5};
    for (int d = 0; d < 6; ++d) {
        for (int c = 0; c < 12; ++c) {
            double v = scale[d] * c;
            if (d % 2 == 0) v -= 0.5;
            phi[d][c] = radius[d] * std::cos(kPi * v);
        }
    }
}

} // anonymous namespace

SpectralAnalyzer::SpectralAnalyzer(int sample_rate, int n_fft, int hop)
    : sr_(sample_rate), n_fft_(n_fft), hop_(hop) {
    if (sr_ <= 0 || n_fft_ < 16 || (n_fft_ & (n_fft_ - 1)) != 0 || hop_ <= 0) {
        throw std::invalid_argument("SpectralAnalyzer: bad sample rate / fft size / hop");
    }

    // Periodic Hann window
    window_.resize(n_fft_);
    for (int i = 0; i < n_fft_; ++i)
        window_[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * kPi * i / n_fft_));

    freqs_.resize(num_bins());
    for (int k = 0; k < num_bins(); ++k)
        freqs_[k] = static_cast<float>(static_cast<double>(k) * sr_ / n_fft_);

    build_chroma_filters();
    build_contrast_bands();
}

// ============================================================
// Chroma filter bank: Gaussian bumps around each pitch class, octave
// weighted around C5, rows starting at C
// ============================================================
void SpectralAnalyzer::build_chroma_filters() {
    const int n_chroma = kChromaBins;
    const double a440_base = 440.0 / 16.0;

    std::vector<double> frqbins(n_fft_);
    for (int i = 1; i < n_fft_; ++i) {
        double f = static_cast<double>(i) * sr_ / n_fft_;
        frqbins[i] = n_chroma * std::log2(f / a440_base);
    }
    frqbins[0] = frqbins[1] - 1.5 * n_chroma;

    std::vector<double> binwidth(n_fft_, 1.0);
    for (int i = 0; i + 1 < n_fft_; ++i)
        binwidth[i] = std::max(frqbins[i + 1] - frqbins[i], 1.0);

    const double half = std::round(n_chroma / 2.0);
    std::vector<double> wts(static_cast<size_t>(n_chroma) * n_fft_);
    for (int c = 0; c < n_chroma; ++c) {
        for (int i = 0; i < n_fft_; ++i) {
            double d = std::fmod(frqbins[i] - c + half + 10.0 * n_chroma, n_chroma);
            if (d < 0) d += n_chroma;
            d -= half;
            double z = 2.0 * d / binwidth[i];
            wts[static_cast<size_t>(c) * n_fft_ + i] = std::exp(-0.5 * z * z);
        }
    }

    // L2-normalise each column, then apply the octave weighting
    const double ctroct = 5.0, octwidth = 2.0;
    for (int i = 0; i < n_fft_; ++i) {
        double norm = 0.0;
        for (int c = 0; c < n_chroma; ++c) {
            double w = wts[static_cast<size_t>(c) * n_fft_ + i];
            norm += w * w;
        }
        norm = std::sqrt(norm);
        double oct = (frqbins[i] / n_chroma - ctroct) / octwidth;
        double oct_w = std::exp(-0.5 * oct * oct);
        for (int c = 0; c < n_chroma; ++c) {
            double& w = wts[static_cast<size_t>(c) * n_fft_ + i];
            if (norm > DBL_MIN) w /= norm;
            w *= oct_w;
        }
    }

    // Rotate so that row 0 is C (the bank above starts at A)
    chroma_wts_.assign(static_cast<size_t>(n_chroma) * num_bins(), 0.0f);
    for (int c = 0; c < n_chroma; ++c) {
        int src = (c + 3) % n_chroma;
        for (int k = 0; k < num_bins(); ++k)
            chroma_wts_[static_cast<size_t>(c) * num_bins() + k] =
                static_cast<float>(wts[static_cast<size_t>(src) * n_fft_ + k]);
    }
}

// ============================================================
// Octave sub-bands for spectral contrast: [0,200], [200,400], ... with
// the last band running to Nyquist. Each band after the first borrows
// the bin just below it; all but the last drop their top bin.
// ============================================================
void SpectralAnalyzer::build_contrast_bands() {
    const int nb = num_bins();
    std::vector<double> octa(kContrastBands + 2, 0.0);
    for (int j = 1; j < kContrastBands + 2; ++j)
        octa[j] = kContrastFmin * std::pow(2.0, j - 1);

    bands_.clear();
    for (int k = 0; k <= kContrastBands; ++k) {
        int first = -1, last = -1;
        for (int i = 0; i < nb; ++i) {
            if (freqs_[i] >= octa[k] && freqs_[i] <= octa[k + 1]) {
                if (first < 0) first = i;
                last = i;
            }
        }
        if (first < 0) {
            // Band above Nyquist: fall back to the top bin
            first = last = nb - 1;
        }
        if (k > 0 && first > 0) --first;
        if (k == kContrastBands) last = nb - 1;

        Band b;
        b.first = first;
        b.width = last - first + 1;
        b.last  = (k < kContrastBands && last > first) ? last - 1 : last;
        bands_.push_back(b);
    }
}

std::vector<float> SpectralAnalyzer::reflect_pad(const std::vector<float>& pcm, int pad) {
    const int n = static_cast<int>(pcm.size());
    if (n == 0 || pad <= 0) return pcm;

    std::vector<float> out(static_cast<size_t>(n) + 2 * static_cast<size_t>(pad));
    const int period = 2 * (n - 1);
    for (int i = 0; i < static_cast<int>(out.size()); ++i) {
        int src = i - pad;
        if (n == 1) {
            src = 0;
        } else {
            src %= period;
            if (src < 0) src += period;
            if (src >= n) src = period - src;
        }
        out[i] = pcm[src];
    }
    return out;
}

std::vector<float> SpectralAnalyzer::magnitude_stft(const std::vector<float>& pcm,
                                                    int& num_frames) const {
    num_frames = 0;
    if (pcm.empty()) return {};

    std::vector<float> padded = reflect_pad(pcm, n_fft_ / 2);
    num_frames = 1 + static_cast<int>(pcm.size()) / hop_;

    const int nb = num_bins();
    std::vector<float> mag(static_cast<size_t>(num_frames) * nb);
    std::vector<float> buf(n_fft_);
    knf::Rfft rfft(n_fft_);

    for (int t = 0; t < num_frames; ++t) {
        const float* src = padded.data() + static_cast<size_t>(t) * hop_;
        for (int j = 0; j < n_fft_; ++j) buf[j] = src[j] * window_[j];
        rfft.Compute(buf.data());

        // Packed layout: [R0, R(n/2), R1, I1, R2, I2, ...]
        float* row = mag.data() + static_cast<size_t>(t) * nb;
        row[0]      = std::abs(buf[0]);
        row[nb - 1] = std::abs(buf[1]);
        for (int k = 1; k < nb - 1; ++k)
            row[k] = std::hypot(buf[2 * k], buf[2 * k + 1]);
    }
    return mag;
}

// ============================================================
SpectralFrames SpectralAnalyzer::analyze(const std::vector<float>& pcm) const {
    SpectralFrames out;
    int T = 0;
    std::vector<float> mag = magnitude_stft(pcm, T);
    if (T == 0) return out;

    const int nb = num_bins();
    out.num_frames = T;
    out.centroid.resize(T);
    out.rolloff.resize(T);
    out.bandwidth.resize(T);
    out.flatness.resize(T);
    out.zcr.resize(T);
    out.rms.resize(T);
    out.chroma.resize(static_cast<size_t>(T) * kChromaBins);
    out.tonnetz.resize(static_cast<size_t>(T) * kTonnetzDims);

    const int n_bands = static_cast<int>(bands_.size());
    std::vector<double> peaks(static_cast<size_t>(T) * n_bands);
    std::vector<double> valleys(static_cast<size_t>(T) * n_bands);

    double phi[6][12];
    tonnetz_basis(phi);

    std::vector<float> sub;
    for (int t = 0; t < T; ++t) {
        const float* S = mag.data() + static_cast<size_t>(t) * nb;

        // --- Centroid / bandwidth over the L1-normalised magnitude ---
        double total = 0.0;
        for (int k = 0; k < nb; ++k) total += S[k];
        double norm = total > DBL_MIN ? total : 1.0;
        double centroid = 0.0;
        for (int k = 0; k < nb; ++k) centroid += freqs_[k] * (S[k] / norm);
        double spread = 0.0;
        for (int k = 0; k < nb; ++k) {
            double dev = freqs_[k] - centroid;
            spread += (S[k] / norm) * dev * dev;
        }
        out.centroid[t]  = static_cast<float>(centroid);
        out.bandwidth[t] = static_cast<float>(std::sqrt(spread));

        // --- Roll-off: lowest frequency holding 85% of the magnitude ---
        double threshold = kRollPercent * total;
        double cum = 0.0;
        float rolloff = freqs_[nb - 1];
        for (int k = 0; k < nb; ++k) {
            cum += S[k];
            if (cum >= threshold) { rolloff = freqs_[k]; break; }
        }
        out.rolloff[t] = rolloff;

        // --- Flatness on the power spectrum ---
        double log_sum = 0.0, lin_sum = 0.0;
        for (int k = 0; k < nb; ++k) {
            double p = std::max(kPowerFloor, static_cast<double>(S[k]) * S[k]);
            log_sum += std::log(p);
            lin_sum += p;
        }
        out.flatness[t] = static_cast<float>(std::exp(log_sum / nb) / (lin_sum / nb));

        // --- Contrast: quantile peak / valley per sub-band ---
        for (int b = 0; b < n_bands; ++b) {
            const Band& band = bands_[b];
            sub.assign(S + band.first, S + band.last + 1);
            std::sort(sub.begin(), sub.end());
            int q = static_cast<int>(std::nearbyint(kContrastQuantile * band.width));
            q = std::max(1, std::min(q, static_cast<int>(sub.size())));
            double lo = 0.0, hi = 0.0;
            for (int i = 0; i < q; ++i) {
                lo += sub[i];
                hi += sub[sub.size() - 1 - i];
            }
            valleys[static_cast<size_t>(t) * n_bands + b] = lo / q;
            peaks[static_cast<size_t>(t) * n_bands + b]   = hi / q;
        }

        // --- Chroma from the power spectrum ---
        double chroma[kChromaBins];
        double cmax = 0.0, csum = 0.0;
        for (int c = 0; c < kChromaBins; ++c) {
            const float* w = chroma_wts_.data() + static_cast<size_t>(c) * nb;
            double acc = 0.0;
            for (int k = 0; k < nb; ++k) acc += w[k] * (static_cast<double>(S[k]) * S[k]);
            chroma[c] = acc;
            cmax = std::max(cmax, std::abs(acc));
        }
        if (cmax < DBL_MIN) cmax = 1.0;
        for (int c = 0; c < kChromaBins; ++c) {
            chroma[c] /= cmax;
            out.chroma[static_cast<size_t>(t) * kChromaBins + c] = static_cast<float>(chroma[c]);
            csum += std::abs(chroma[c]);
        }

        // --- Tonnetz: tonal centroid of the L1-normalised chroma ---
        if (csum < DBL_MIN) csum = 1.0;
        for (int d = 0; d < kTonnetzDims; ++d) {
            double acc = 0.0;
            for (int c = 0; c < kChromaBins; ++c) acc += phi[d][c] * (chroma[c] / csum);
            out.tonnetz[static_cast<size_t>(t) * kTonnetzDims + d] = static_cast<float>(acc);
        }
    }

    // Contrast in dB, each of the peak and valley arrays clipped 80 dB below its maximum
    power_to_db(peaks);
    power_to_db(valleys);
    out.contrast.resize(peaks.size());
    for (size_t i = 0; i < peaks.size(); ++i)
        out.contrast[i] = static_cast<float>(peaks[i] - valleys[i]);

    // --- ZCR and RMS over the same centred frames ---
    std::vector<float> padded = reflect_pad(pcm, n_fft_ / 2);
    for (int t = 0; t < T; ++t) {
        const float* f = padded.data() + static_cast<size_t>(t) * hop_;
        int crossings = 0;
        double energy = 0.0;
        for (int j = 0; j < n_fft_; ++j) {
            energy += static_cast<double>(f[j]) * f[j];
            if (j > 0 && is_negative(f[j]) != is_negative(f[j - 1])) ++crossings;
        }
        out.zcr[t] = static_cast<float>(crossings) / n_fft_;
        out.rms[t] = static_cast<float>(std::sqrt(energy / n_fft_));
    }

    return out;
}

} // namespace vg
