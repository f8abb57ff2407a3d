#ifndef VG_FEATURE_EXTRACTOR_H
#define VG_FEATURE_EXTRACTOR_H

#include "core/waveform.h"
#include "core/spectral_analyzer.h"
#include "core/mfcc_extractor.h"
#include <map>
#include <string>
#include <vector>

namespace vg {

enum class ExtractionStatus {
    OK = 0,
    EMPTY,    // zero-length input or decode failure
    SILENT,   // non-empty input with no energy
    FAILED    // non-finite intermediate or internal error
};

const char* extraction_status_name(ExtractionStatus status);

/**
 * Named scalar aggregates of one waveform. Ten frame-level feature sets,
 * each reduced to <set>_mean/_std/_min/_max/_skew/_kurtosis, plus
 * mfcc13_std (spread of the first 13 cepstral coefficients).
 * Every name is always present; a non-OK vector holds zeros.
 */
class FeatureVector {
public:
    // Construct from raw values; names missing from `values` read as 0.
    explicit FeatureVector(ExtractionStatus status = ExtractionStatus::EMPTY,
                           std::map<std::string, float> values = {});

    static FeatureVector zeros(ExtractionStatus status);

    // Feature set names in advanced-vector order
    static const std::vector<std::string>& set_names();
    static const std::vector<std::string>& statistic_names();
    // All feature names: the 60 set statistics followed by mfcc13_std
    static const std::vector<std::string>& feature_names();
    static std::string key(const std::string& set, const std::string& statistic);

    static constexpr int kAdvancedSize = 60;

    ExtractionStatus status() const { return status_; }
    bool ok() const { return status_ == ExtractionStatus::OK; }

    float get(const std::string& name) const;
    float get(const std::string& set, const std::string& statistic) const {
        return get(key(set, statistic));
    }

    const std::map<std::string, float>& values() const { return values_; }

    // The 60 set statistics in fixed order, for model input
    std::vector<float> advanced_vector() const;

private:
    ExtractionStatus status_;
    std::map<std::string, float> values_;
};

class FeatureExtractor {
public:
    explicit FeatureExtractor(int sample_rate = 22050);

    // Never throws: failures come back as a zero vector with a non-OK status.
    FeatureVector extract(const Waveform& wav) const;
    FeatureVector extract(const std::vector<float>& pcm) const;

    const MfccExtractor& mfcc() const { return mfcc_; }
    int sample_rate() const { return sample_rate_; }

    static constexpr int kNumMfcc = 20;
    static constexpr int kNumLanguageMfcc = 13;

private:
    FeatureVector compute(const std::vector<float>& pcm) const;

    int sample_rate_;
    SpectralAnalyzer spectral_;
    MfccExtractor mfcc_;
};

} // namespace vg

#endif // VG_FEATURE_EXTRACTOR_H
