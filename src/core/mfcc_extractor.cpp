#include "core/mfcc_extractor.h"
#include "utils/logger.h"
#include "kaldi-native-fbank/csrc/online-feature.h"
#include <cmath>
#include <algorithm>

namespace vg {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kTopDb = 80.0;
// Natural-log energies to decibels
const double kLnToDb = 10.0 / std::log(10.0);

} // anonymous namespace

MfccExtractor::MfccExtractor() { init(); }
MfccExtractor::~MfccExtractor() = default;

void MfccExtractor::init(int sample_rate, int num_mel_bins,
                         int frame_length, int frame_shift) {
    sample_rate_ = sample_rate;
    num_bins_ = num_mel_bins;
    frame_length_ = frame_length;
    frame_shift_ = frame_shift;
    // Half a sample of slack so the library's sample-count truncation lands exactly
    frame_length_ms_ = static_cast<float>((frame_length + 0.5) * 1000.0 / sample_rate);
    frame_shift_ms_ = static_cast<float>((frame_shift + 0.5) * 1000.0 / sample_rate);

    dct_.assign(static_cast<size_t>(num_bins_) * num_bins_, 0.0);
    for (int k = 0; k < num_bins_; ++k) {
        double scale = std::sqrt((k == 0 ? 1.0 : 2.0) / num_bins_);
        for (int n = 0; n < num_bins_; ++n) {
            dct_[static_cast<size_t>(k) * num_bins_ + n] =
                scale * std::cos(kPi * k * (2.0 * n + 1.0) / (2.0 * num_bins_));
        }
    }

    VG_LOG_DEBUG("MFCC initialized: bins={}, rate={}, frame_len={}, frame_shift={}",
                 num_bins_, sample_rate_, frame_length_, frame_shift_);
}

std::vector<float> MfccExtractor::extract(const std::vector<float>& audio, int num_ceps,
                                          int& num_frames) const {
    num_frames = 0;
    if (audio.empty() || num_ceps <= 0) return {};
    num_ceps = std::min(num_ceps, num_bins_);

    // Configure kaldi-native-fbank: plain Hann frames centred on the hop grid
    knf::FbankOptions opts;
    opts.frame_opts.samp_freq = static_cast<float>(sample_rate_);
    opts.frame_opts.frame_length_ms = frame_length_ms_;
    opts.frame_opts.frame_shift_ms = frame_shift_ms_;
    opts.frame_opts.dither = 0.0f;
    opts.frame_opts.preemph_coeff = 0.0f;
    opts.frame_opts.remove_dc_offset = false;
    opts.frame_opts.snip_edges = false;
    opts.frame_opts.window_type = "hanning";
    opts.mel_opts.num_bins = num_bins_;
    opts.mel_opts.low_freq = 0.0f;
    opts.mel_opts.high_freq = 0.0f; // Nyquist
    opts.use_energy = false;
    opts.use_log_fbank = true;
    opts.use_power = true;

    knf::OnlineFbank fbank(opts);

    // Accept waveform
    fbank.AcceptWaveform(static_cast<float>(sample_rate_), audio.data(),
                         static_cast<int32_t>(audio.size()));
    fbank.InputFinished();

    int frames = fbank.NumFramesReady();
    if (frames <= 0) {
        VG_LOG_WARN("MFCC: no frames extracted from {} samples", audio.size());
        return {};
    }

    // Log-mel in dB, floored relative to the loudest cell
    std::vector<double> mel_db(static_cast<size_t>(frames) * num_bins_);
    double max_db = -1e300;
    for (int i = 0; i < frames; ++i) {
        const float* frame = fbank.GetFrame(i);
        for (int b = 0; b < num_bins_; ++b) {
            double v = frame[b] * kLnToDb;
            mel_db[static_cast<size_t>(i) * num_bins_ + b] = v;
            max_db = std::max(max_db, v);
        }
    }
    for (auto& v : mel_db) v = std::max(v, max_db - kTopDb);

    std::vector<float> ceps(static_cast<size_t>(frames) * num_ceps);
    for (int i = 0; i < frames; ++i) {
        const double* row = mel_db.data() + static_cast<size_t>(i) * num_bins_;
        for (int k = 0; k < num_ceps; ++k) {
            const double* basis = dct_.data() + static_cast<size_t>(k) * num_bins_;
            double acc = 0.0;
            for (int b = 0; b < num_bins_; ++b) acc += basis[b] * row[b];
            ceps[static_cast<size_t>(i) * num_ceps + k] = static_cast<float>(acc);
        }
    }

    num_frames = frames;
    VG_LOG_DEBUG("MFCC: extracted {} frames x {} ceps from {} samples",
                 frames, num_ceps, audio.size());
    return ceps;
}

std::vector<float> MfccExtractor::extract_mean(const std::vector<float>& audio,
                                               int num_ceps) const {
    int frames = 0;
    std::vector<float> ceps = extract(audio, num_ceps, frames);
    if (frames <= 0) return {};
    num_ceps = std::min(num_ceps, num_bins_);

    std::vector<double> acc(num_ceps, 0.0);
    for (int i = 0; i < frames; ++i)
        for (int k = 0; k < num_ceps; ++k)
            acc[k] += ceps[static_cast<size_t>(i) * num_ceps + k];

    std::vector<float> mean(num_ceps);
    for (int k = 0; k < num_ceps; ++k) mean[k] = static_cast<float>(acc[k] / frames);
    return mean;
}

} // namespace vg
