#ifndef VG_MFCC_EXTRACTOR_H
#define VG_MFCC_EXTRACTOR_H

#include <vector>

namespace vg {

// Mel-frequency cepstral coefficients on top of a kaldi mel filterbank.
// Log-mel energies are converted to decibels (floored 80 dB below the
// loudest cell), then projected with an orthonormal DCT-II.
class MfccExtractor {
public:
    MfccExtractor();
    ~MfccExtractor();

    // Initialize with parameters
    void init(int sample_rate = 22050, int num_mel_bins = 128,
              int frame_length = 2048, int frame_shift = 512);

    // Extract cepstra from audio.
    // Output: [num_frames, num_ceps] row-major; empty when no frame fits.
    std::vector<float> extract(const std::vector<float>& audio, int num_ceps,
                               int& num_frames) const;

    // Mean over frames of each coefficient: [num_ceps]
    std::vector<float> extract_mean(const std::vector<float>& audio, int num_ceps) const;

    int num_mel_bins() const { return num_bins_; }
    int sample_rate() const { return sample_rate_; }

private:
    int sample_rate_ = 22050;
    int num_bins_ = 128;
    int frame_length_ = 2048;
    int frame_shift_ = 512;
    float frame_length_ms_ = 0.0f;
    float frame_shift_ms_ = 0.0f;

    // Orthonormal DCT-II basis: [num_bins, num_bins] row-major, row k = coefficient k
    std::vector<double> dct_;
};

} // namespace vg

#endif // VG_MFCC_EXTRACTOR_H
