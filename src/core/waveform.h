#ifndef VG_WAVEFORM_H
#define VG_WAVEFORM_H

#include <vector>

namespace vg {

// Decoded mono audio. Samples are float32 in [-1.0, 1.0].
struct Waveform {
    std::vector<float> samples;
    int sample_rate = 22050;

    bool empty() const { return samples.empty(); }
    double duration_sec() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

} // namespace vg

#endif // VG_WAVEFORM_H
