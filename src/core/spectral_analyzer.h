#ifndef VG_SPECTRAL_ANALYZER_H
#define VG_SPECTRAL_ANALYZER_H

#include <vector>

namespace vg {

// Per-frame spectral descriptors of one waveform. Frame t of every
// vector describes the same 2048-sample window centred on sample t*hop.
struct SpectralFrames {
    int num_frames = 0;

    std::vector<float> centroid;   // [T] Hz
    std::vector<float> rolloff;    // [T] Hz, 85% of magnitude
    std::vector<float> bandwidth;  // [T] Hz, second-order
    std::vector<float> flatness;   // [T] power-spectrum Wiener entropy
    std::vector<float> zcr;        // [T] zero crossings per sample
    std::vector<float> rms;        // [T]

    std::vector<float> contrast;   // [T, 7] row-major, dB
    std::vector<float> chroma;     // [T, 12] row-major, max-normalised per frame
    std::vector<float> tonnetz;    // [T, 6] row-major
};

class SpectralAnalyzer {
public:
    static constexpr int kChromaBins   = 12;
    static constexpr int kContrastBands = 6;   // octave bands, plus one residual band
    static constexpr int kTonnetzDims  = 6;

    explicit SpectralAnalyzer(int sample_rate = 22050, int n_fft = 2048, int hop = 512);

    // Compute all frame descriptors. Empty input yields num_frames == 0.
    SpectralFrames analyze(const std::vector<float>& pcm) const;

    // Magnitude STFT with a periodic Hann window, frames centred by reflect
    // padding. Output: [num_frames, num_bins()] row-major.
    std::vector<float> magnitude_stft(const std::vector<float>& pcm, int& num_frames) const;

    // Mirror-pad `pad` samples on both sides (edge sample not repeated).
    static std::vector<float> reflect_pad(const std::vector<float>& pcm, int pad);

    int num_bins() const { return n_fft_ / 2 + 1; }
    int sample_rate() const { return sr_; }
    int hop() const { return hop_; }

private:
    void build_chroma_filters();
    void build_contrast_bands();

    int sr_;
    int n_fft_;
    int hop_;

    std::vector<float> window_;      // [n_fft]
    std::vector<float> freqs_;       // [num_bins] Hz
    std::vector<float> chroma_wts_;  // [12, num_bins] row-major

    // Inclusive bin range of each contrast sub-band and the bin count
    // the quantile is taken against
    struct Band { int first; int last; int width; };
    std::vector<Band> bands_;
};

} // namespace vg

#endif // VG_SPECTRAL_ANALYZER_H
