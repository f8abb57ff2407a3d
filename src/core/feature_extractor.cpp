#include "core/feature_extractor.h"
#include "core/audio_processor.h"
#include "core/signal_stats.h"
#include "utils/logger.h"
#include <cmath>
#include <exception>

namespace vg {

const char* extraction_status_name(ExtractionStatus status) {
    switch (status) {
        case ExtractionStatus::OK:     return "ok";
        case ExtractionStatus::EMPTY:  return "empty";
        case ExtractionStatus::SILENT: return "silent";
        case ExtractionStatus::FAILED: return "failed";
        default:                       return "unknown";
    }
}

// ============================================================
// FeatureVector
// ============================================================
FeatureVector::FeatureVector(ExtractionStatus status, std::map<std::string, float> values)
    : status_(status), values_(std::move(values)) {
    for (const auto& name : feature_names())
        values_.emplace(name, 0.0f);
}

FeatureVector FeatureVector::zeros(ExtractionStatus status) {
    return FeatureVector(status);
}

const std::vector<std::string>& FeatureVector::set_names() {
    static const std::vector<std::string> kSets = {
        "spectral_centroid", "spectral_rolloff", "spectral_bandwidth",
        "spectral_contrast", "spectral_flatness", "mfcc", "chroma",
        "zero_crossing_rate", "rms", "tonnetz",
    };
    return kSets;
}

const std::vector<std::string>& FeatureVector::statistic_names() {
    static const std::vector<std::string> kStats = {
        "mean", "std", "min", "max", "skew", "kurtosis",
    };
    return kStats;
}

const std::vector<std::string>& FeatureVector::feature_names() {
    static const std::vector<std::string> kNames = [] {
        std::vector<std::string> names;
        for (const auto& set : set_names())
            for (const auto& stat : statistic_names())
                names.push_back(key(set, stat));
        names.push_back("mfcc13_std");
        return names;
    }();
    return kNames;
}

std::string FeatureVector::key(const std::string& set, const std::string& statistic) {
    return set + "_" + statistic;
}

float FeatureVector::get(const std::string& name) const {
    auto it = values_.find(name);
    return it != values_.end() ? it->second : 0.0f;
}

std::vector<float> FeatureVector::advanced_vector() const {
    std::vector<float> v;
    v.reserve(kAdvancedSize);
    for (const auto& set : set_names())
        for (const auto& stat : statistic_names())
            v.push_back(get(set, stat));
    return v;
}

// ============================================================
// FeatureExtractor
// ============================================================
FeatureExtractor::FeatureExtractor(int sample_rate)
    : sample_rate_(sample_rate), spectral_(sample_rate) {
    mfcc_.init(sample_rate);
}

FeatureVector FeatureExtractor::extract(const Waveform& wav) const {
    if (wav.samples.empty()) return extract(wav.samples);
    if (wav.sample_rate != sample_rate_) {
        return extract(AudioProcessor::resample(wav.samples, wav.sample_rate, sample_rate_));
    }
    return extract(wav.samples);
}

FeatureVector FeatureExtractor::extract(const std::vector<float>& pcm) const {
    if (pcm.empty()) {
        VG_LOG_WARN("Feature extraction: empty signal");
        return FeatureVector::zeros(ExtractionStatus::EMPTY);
    }
    if (!dsp::all_finite(pcm)) {
        VG_LOG_WARN("Feature extraction: signal holds non-finite samples");
        return FeatureVector::zeros(ExtractionStatus::FAILED);
    }
    if (dsp::peak_amplitude(pcm) == 0.0f) {
        VG_LOG_WARN("Feature extraction: silent signal ({} samples)", pcm.size());
        return FeatureVector::zeros(ExtractionStatus::SILENT);
    }

    try {
        return compute(pcm);
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Feature extraction error: {}", e.what());
        return FeatureVector::zeros(ExtractionStatus::FAILED);
    }
}

FeatureVector FeatureExtractor::compute(const std::vector<float>& pcm) const {
    SpectralFrames frames = spectral_.analyze(pcm);
    int mfcc_frames = 0;
    std::vector<float> mfcc = mfcc_.extract(pcm, kNumMfcc, mfcc_frames);
    if (frames.num_frames == 0 || mfcc_frames == 0) {
        VG_LOG_WARN("Feature extraction: no analysis frames for {} samples", pcm.size());
        return FeatureVector::zeros(ExtractionStatus::FAILED);
    }

    std::map<std::string, float> values;
    auto add_set = [&values](const std::string& set, const std::vector<float>& data) {
        dsp::Moments m = dsp::describe(data);
        values[FeatureVector::key(set, "mean")]     = static_cast<float>(m.mean);
        values[FeatureVector::key(set, "std")]      = static_cast<float>(m.std);
        values[FeatureVector::key(set, "min")]      = static_cast<float>(m.min);
        values[FeatureVector::key(set, "max")]      = static_cast<float>(m.max);
        values[FeatureVector::key(set, "skew")]     = static_cast<float>(m.skew);
        values[FeatureVector::key(set, "kurtosis")] = static_cast<float>(m.kurtosis);
    };

    add_set("spectral_centroid", frames.centroid);
    add_set("spectral_rolloff", frames.rolloff);
    add_set("spectral_bandwidth", frames.bandwidth);
    add_set("spectral_contrast", frames.contrast);
    add_set("spectral_flatness", frames.flatness);
    add_set("mfcc", mfcc);
    add_set("chroma", frames.chroma);
    add_set("zero_crossing_rate", frames.zcr);
    add_set("rms", frames.rms);
    add_set("tonnetz", frames.tonnetz);

    // Spread of the first 13 coefficients only
    std::vector<float> mfcc13;
    mfcc13.reserve(static_cast<size_t>(mfcc_frames) * kNumLanguageMfcc);
    for (int i = 0; i < mfcc_frames; ++i)
        for (int k = 0; k < kNumLanguageMfcc; ++k)
            mfcc13.push_back(mfcc[static_cast<size_t>(i) * kNumMfcc + k]);
    values["mfcc13_std"] = static_cast<float>(dsp::describe(mfcc13).std);

    for (const auto& kv : values) {
        if (!std::isfinite(kv.second)) {
            VG_LOG_WARN("Feature extraction: non-finite value for {}", kv.first);
            return FeatureVector::zeros(ExtractionStatus::FAILED);
        }
    }

    VG_LOG_DEBUG("Features: {} STFT frames, {} MFCC frames, centroid_mean={:.1f}, "
                 "mfcc13_std={:.2f}", frames.num_frames, mfcc_frames,
                 values["spectral_centroid_mean"], values["mfcc13_std"]);
    return FeatureVector(ExtractionStatus::OK, std::move(values));
}

} // namespace vg
