#ifndef VG_VOICE_CLONING_DETECTOR_H
#define VG_VOICE_CLONING_DETECTOR_H

#include "core/analysis_types.h"
#include "core/feature_extractor.h"
#include "core/mfcc_extractor.h"
#include "core/waveform.h"
#include <memory>
#include <string>
#include <vector>

namespace vg {

class CloningModel;

// One sub-scorer's verdict: score in [0,1] and the indicators it raised
struct SubScore {
    float score = 0.0f;
    std::vector<std::string> indicators;
};

// Threshold step: first tier whose test passes adds `weight`
struct Tier {
    double bound;
    float  weight;
    const char* indicator;
};

// Raw measurements behind the pattern sub-score
struct PatternMeasures {
    bool   has_energy_cv = false;   // false when no frame had energy
    double energy_cv     = 0.0;     // std / mean of frame energies
    int    voiced_frames = 0;
    double f0_std_hz     = 0.0;
};

/**
 * Synthetic ("AI-cloned") voice detector. Natural speech fluctuates; synthetic
 * speech tends to hold its spectral shape, energy, pitch and cepstral summary
 * unusually steady. Three independent sub-scores measure that steadiness and
 * are fused with fixed weights:
 *
 *   final = 0.5 * heuristic + 0.3 * pattern + 0.2 * temporal
 *
 * A sub-score that fails internally counts as 0. Failed feature extraction
 * (including a silent signal) yields fallback().
 */
class VoiceCloningDetector {
public:
    static constexpr float kHeuristicWeight = 0.5f;
    static constexpr float kPatternWeight   = 0.3f;
    static constexpr float kTemporalWeight  = 0.2f;
    static constexpr float kDecisionThreshold = 0.65f;
    static constexpr float kHighRiskThreshold = 0.80f;
    // Pitch stability needs strictly more voiced frames than this
    static constexpr int kMinVoicedFrames = 10;

    explicit VoiceCloningDetector(int sample_rate = 22050,
                                  std::shared_ptr<const CloningModel> model = nullptr);
    virtual ~VoiceCloningDetector();

    // Never throws.
    virtual VoiceCloningDetectionResult detect(const Waveform& wav,
                                               const FeatureVector& features) const;

    // Statistical consistency of the frame-level feature spreads
    static SubScore heuristic_score(const FeatureVector& features);

    // Frame-energy and pitch stability of the raw signal
    SubScore pattern_score(const std::vector<float>& pcm) const;

    // Cepstral similarity of consecutive 2-second segments
    SubScore temporal_score(const std::vector<float>& pcm) const;

    // Tier selection; nullptr when no tier applies.
    // Energy CV and pitch std count when strictly below a bound, segment
    // similarity when strictly above one.
    static const Tier* energy_stability_tier(double energy_cv);
    static const Tier* pitch_stability_tier(int voiced_frames, double f0_std_hz);
    static const Tier* segment_similarity_tier(double mean_similarity);

    static SubScore score_pattern(const PatternMeasures& measures);

    static float fuse(float heuristic, float pattern, float temporal);
    static RiskLevel risk_level_for(float confidence);

    // {false, 0.0, low, "error"}
    static VoiceCloningDetectionResult fallback();

    int sample_rate() const { return sample_rate_; }

protected:
    // Sub-scorers as invoked by detect(). A throw or a non-finite score
    // from any of them counts as 0 for that component only.
    virtual SubScore run_heuristic(const FeatureVector& features) const {
        return heuristic_score(features);
    }
    virtual SubScore run_pattern(const std::vector<float>& pcm) const {
        return pattern_score(pcm);
    }
    virtual SubScore run_temporal(const std::vector<float>& pcm) const {
        return temporal_score(pcm);
    }

private:
    int sample_rate_;
    MfccExtractor mfcc_;
    std::shared_ptr<const CloningModel> model_;
};

} // namespace vg

#endif // VG_VOICE_CLONING_DETECTOR_H
