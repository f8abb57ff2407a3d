#include "core/audio_processor.h"
#include "utils/logger.h"
#include <fstream>
#include <sstream>
#include <cstring>
#include <cmath>
#include <algorithm>

namespace vg {

namespace {

constexpr uint16_t kFormatPcm   = 1;
constexpr uint16_t kFormatFloat = 3;

struct WavFormat {
    uint16_t format   = 0;
    uint16_t channels = 0;
    uint32_t rate     = 0;
    uint16_t bits     = 0;
};

// RIFF fields are little endian, as is every supported host
template<typename T>
bool read_field(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    return in.gcount() == static_cast<std::streamsize>(sizeof(T));
}

bool read_tag(std::istream& in, char (&tag)[4]) {
    in.read(tag, 4);
    return in.gcount() == 4;
}

bool tag_is(const char (&tag)[4], const char* name) {
    return std::strncmp(tag, name, 4) == 0;
}

// Chunks are word aligned: odd sizes carry one pad byte
uint32_t padded(uint32_t size) { return size + (size & 1u); }

// Reads up to `size` bytes in blocks, so a declared size larger than the
// stream only costs what is actually there.
constexpr size_t kReadBlock = 1u << 20;

void read_payload(std::istream& in, uint32_t size, std::vector<uint8_t>& payload) {
    size_t remaining = size;
    while (remaining > 0) {
        const size_t want = std::min(remaining, kReadBlock);
        const size_t offset = payload.size();
        payload.resize(offset + want);
        in.read(reinterpret_cast<char*>(payload.data() + offset),
                static_cast<std::streamsize>(want));
        const size_t got = static_cast<size_t>(in.gcount());
        payload.resize(offset + got);
        if (got < want) break;
        remaining -= got;
    }
}

// Interleaved samples to float32 in [-1, 1]. False for unsupported encodings.
bool to_float(const WavFormat& fmt, const std::vector<uint8_t>& bytes, std::vector<float>& out) {
    if (fmt.format == kFormatPcm && fmt.bits == 16) {
        std::vector<int16_t> pcm(bytes.size() / 2);
        std::memcpy(pcm.data(), bytes.data(), pcm.size() * 2);
        out = AudioProcessor::int16_to_float(pcm.data(), pcm.size());
        return true;
    }
    if (fmt.format == kFormatPcm && fmt.bits == 8) {
        out.resize(bytes.size());
        std::transform(bytes.begin(), bytes.end(), out.begin(),
                       [](uint8_t b) { return (static_cast<float>(b) - 128.0f) / 128.0f; });
        return true;
    }
    if (fmt.format == kFormatFloat && fmt.bits == 32) {
        out.resize(bytes.size() / 4);
        std::memcpy(out.data(), bytes.data(), out.size() * 4);
        return true;
    }
    return false;
}

// Average all channels of each complete frame
std::vector<float> downmix(const std::vector<float>& interleaved, int channels) {
    if (channels == 1) return interleaved;
    std::vector<float> mono(interleaved.size() / channels);
    for (size_t i = 0; i < mono.size(); ++i) {
        double sum = 0.0;
        for (int c = 0; c < channels; ++c) sum += interleaved[i * channels + c];
        mono[i] = static_cast<float>(sum / channels);
    }
    return mono;
}

} // anonymous namespace

bool AudioProcessor::fail(const std::string& message) {
    last_error_ = message;
    VG_LOG_ERROR(last_error_);
    return false;
}

bool AudioProcessor::read_wav(const std::string& wav_path, std::vector<float>& out_samples,
                              int& out_sample_rate) {
    std::ifstream file(wav_path, std::ios::binary);
    if (!file.is_open()) return fail("Cannot open file: " + wav_path);
    return parse_wav(file, out_samples, out_sample_rate);
}

bool AudioProcessor::read_wav_buffer(const void* data, size_t size,
                                     std::vector<float>& out_samples, int& out_sample_rate) {
    if (!data || size == 0) return fail("Empty WAV buffer");
    std::istringstream in(std::string(static_cast<const char*>(data), size),
                          std::ios::binary);
    return parse_wav(in, out_samples, out_sample_rate);
}

bool AudioProcessor::parse_wav(std::istream& in, std::vector<float>& out_samples,
                               int& out_sample_rate) {
    char tag[4] = {};
    uint32_t riff_size = 0;
    if (!read_tag(in, tag) || !tag_is(tag, "RIFF")) return fail("Not a valid RIFF file");
    if (!read_field(in, riff_size) || !read_tag(in, tag) || !tag_is(tag, "WAVE"))
        return fail("Not a valid WAVE file");

    WavFormat fmt;
    bool have_fmt = false;
    std::vector<uint8_t> payload;

    uint32_t chunk_size = 0;
    while (read_tag(in, tag) && read_field(in, chunk_size)) {
        if (tag_is(tag, "fmt ")) {
            if (chunk_size < 16) return fail("Truncated fmt chunk");
            uint32_t byte_rate = 0;
            uint16_t block_align = 0;
            if (!read_field(in, fmt.format) || !read_field(in, fmt.channels) ||
                !read_field(in, fmt.rate) || !read_field(in, byte_rate) ||
                !read_field(in, block_align) || !read_field(in, fmt.bits))
                return fail("Truncated fmt chunk");
            in.seekg(padded(chunk_size) - 16, std::ios::cur);
            have_fmt = true;
        } else if (tag_is(tag, "data")) {
            // Tolerate a data chunk truncated by the writer
            read_payload(in, chunk_size, payload);
            break;
        } else {
            in.seekg(padded(chunk_size), std::ios::cur);
        }
    }

    if (!have_fmt) return fail("No fmt chunk found in WAV data");
    if (payload.empty()) return fail("No audio data found in WAV data");
    if (fmt.format != kFormatPcm && fmt.format != kFormatFloat) {
        return fail("Unsupported audio format: " + std::to_string(fmt.format) +
                    " (only PCM=1 and IEEE float=3 supported)");
    }
    if (fmt.channels == 0 || fmt.rate == 0) {
        return fail("Invalid WAV header: channels=" + std::to_string(fmt.channels) +
                    ", rate=" + std::to_string(fmt.rate));
    }

    VG_LOG_DEBUG("WAV: format={}, channels={}, rate={}, bits={}, bytes={}",
                 fmt.format, fmt.channels, fmt.rate, fmt.bits, payload.size());

    std::vector<float> interleaved;
    if (!to_float(fmt, payload, interleaved))
        return fail("Unsupported bit depth: " + std::to_string(fmt.bits));

    out_samples = downmix(interleaved, fmt.channels);
    out_sample_rate = static_cast<int>(fmt.rate);
    return true;
}

bool AudioProcessor::load(const std::string& wav_path, Waveform& out) {
    std::vector<float> samples;
    int rate = 0;
    if (!read_wav(wav_path, samples, rate)) return false;
    out.samples = normalize(samples, rate);
    out.sample_rate = target_rate_;
    return true;
}

bool AudioProcessor::decode(const void* data, size_t size, Waveform& out) {
    std::vector<float> samples;
    int rate = 0;
    if (!read_wav_buffer(data, size, samples, rate)) return false;
    out.samples = normalize(samples, rate);
    out.sample_rate = target_rate_;
    return true;
}

std::vector<float> AudioProcessor::int16_to_float(const int16_t* data, size_t count) {
    std::vector<float> result(count);
    for (size_t i = 0; i < count; ++i) {
        result[i] = static_cast<float>(data[i]) / 32768.0f;
    }
    return result;
}

std::vector<float> AudioProcessor::resample(const std::vector<float>& input,
                                            int src_rate, int dst_rate) {
    if (src_rate == dst_rate || input.empty() || src_rate <= 0 || dst_rate <= 0) {
        return input;
    }

    const double step = static_cast<double>(src_rate) / dst_rate;
    const size_t last = input.size() - 1;
    std::vector<float> output(static_cast<size_t>(
        std::ceil(input.size() * static_cast<double>(dst_rate) / src_rate)));

    for (size_t i = 0; i < output.size(); ++i) {
        const double pos = i * step;
        const size_t idx = std::min(static_cast<size_t>(pos), last);
        const double frac = pos - static_cast<double>(idx);
        const float a = input[idx];
        const float b = input[std::min(idx + 1, last)];
        output[i] = static_cast<float>(a + (b - a) * frac);
    }
    return output;
}

std::vector<float> AudioProcessor::normalize(const std::vector<float>& input, int sample_rate) {
    if (sample_rate == target_rate_) {
        return input;
    }
    VG_LOG_DEBUG("Resampling from {}Hz to {}Hz", sample_rate, target_rate_);
    return resample(input, sample_rate, target_rate_);
}

} // namespace vg
