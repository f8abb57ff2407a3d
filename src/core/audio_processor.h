#ifndef VG_AUDIO_PROCESSOR_H
#define VG_AUDIO_PROCESSOR_H

#include "core/waveform.h"
#include <vector>
#include <string>
#include <istream>
#include <cstdint>

namespace vg {

class AudioProcessor {
public:
    explicit AudioProcessor(int target_sample_rate = 22050)
        : target_rate_(target_sample_rate) {}

    // Read WAV file and return float32 PCM samples normalized to [-1.0, 1.0]
    // at the file's own rate, down-mixed to mono
    bool read_wav(const std::string& wav_path, std::vector<float>& out_samples,
                  int& out_sample_rate);

    // Same as read_wav for a RIFF/WAVE image held in memory
    bool read_wav_buffer(const void* data, size_t size, std::vector<float>& out_samples,
                         int& out_sample_rate);

    // Decode and bring to the analysis rate. False on decode failure.
    bool load(const std::string& wav_path, Waveform& out);
    bool decode(const void* data, size_t size, Waveform& out);

    // Convert int16 PCM to float32 [-1.0, 1.0]
    static std::vector<float> int16_to_float(const int16_t* data, size_t count);

    // Resample audio to target sample rate (linear interpolation)
    static std::vector<float> resample(const std::vector<float>& input,
                                       int src_rate, int dst_rate);

    // Ensure audio is at the analysis rate
    std::vector<float> normalize(const std::vector<float>& input, int sample_rate);

    int target_rate() const { return target_rate_; }

    // Get last error message
    const std::string& last_error() const { return last_error_; }

private:
    bool fail(const std::string& message);
    bool parse_wav(std::istream& in, std::vector<float>& out_samples, int& out_sample_rate);

    int target_rate_;
    std::string last_error_;
};

} // namespace vg

#endif // VG_AUDIO_PROCESSOR_H
