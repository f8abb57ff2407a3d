#ifndef VG_LANGUAGE_SCORER_H
#define VG_LANGUAGE_SCORER_H

#include "core/analysis_types.h"
#include "core/feature_extractor.h"
#include <map>
#include <string>
#include <vector>

namespace vg {

// Open interval (lo, hi)
struct Interval {
    float lo;
    float hi;
    bool contains(float v) const { return v > lo && v < hi; }
};

// Range predicates of one language and the weight each contributes
struct LanguageRule {
    const char* code;
    Interval centroid;      // joint with roll-off
    Interval rolloff;
    int      spectral_weight;
    Interval zcr;
    int      zcr_weight;
    Interval bandwidth;
    int      bandwidth_weight;
    Interval mfcc_std;
    int      mfcc_weight;
};

/**
 * Rule-based spoken-language scorer over averaged spectral descriptors.
 * Each language accumulates the weights of its satisfied predicates; the
 * highest total wins, earlier rules winning ties.
 */
class LanguageScorer {
public:
    // Rules in tie-break priority order: kn, te, hi, en
    static const std::vector<LanguageRule>& rules();

    // Accumulated score of every supported language
    static std::map<std::string, int> score_table(const FeatureVector& features);

    // 0.85 / 0.70 / 0.55 for scores >= 6 / 4 / 2, otherwise 0.40
    static float confidence_for_score(int score);

    // {en, 0.10}: returned when features could not be extracted
    static LanguageDetectionResult fallback();

    virtual ~LanguageScorer() = default;

    // Never throws.
    virtual LanguageDetectionResult detect(const FeatureVector& features) const;

    static constexpr float kFallbackConfidence = 0.10f;
};

} // namespace vg

#endif // VG_LANGUAGE_SCORER_H
