#include "core/voice_cloning_detector.h"
#include "core/audio_processor.h"
#include "core/cloning_model.h"
#include "core/pitch_tracker.h"
#include "core/signal_stats.h"
#include "core/similarity.h"
#include "utils/logger.h"
#include <algorithm>
#include <cmath>
#include <exception>

namespace vg {

const char* risk_level_name(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW:    return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH:   return "high";
        default:                return "unknown";
    }
}

namespace {

// ============================================================
// Heuristic tables: spread of each feature set
// ============================================================
struct SpreadRule {
    const char* feature;
    Tier tiers[3];
    int  tier_count;
};

const SpreadRule kSpreadRules[] = {
    {"spectral_centroid_std", {{15, 1.0f, "extreme_spectral_consistency"},
                               {35, 0.7f, "high_spectral_consistency"},
                               {70, 0.4f, "moderate_spectral_consistency"}}, 3},
    {"mfcc_std",              {{4,  1.2f, "extreme_mfcc_consistency"},
                               {9,  0.9f, "high_mfcc_consistency"},
                               {16, 0.5f, "moderate_mfcc_consistency"}}, 3},
    {"zero_crossing_rate_std", {{0.004, 0.9f, "extreme_zcr_consistency"},
                                {0.010, 0.6f, "high_zcr_consistency"},
                                {0.018, 0.3f, "moderate_zcr_consistency"}}, 3},
    {"rms_std",               {{0.004, 0.9f, "extreme_energy_consistency"},
                               {0.010, 0.6f, "high_energy_consistency"},
                               {0.018, 0.3f, "moderate_energy_consistency"}}, 3},
    {"spectral_rolloff_std",  {{80,  0.8f, "extreme_rolloff_consistency"},
                               {200, 0.5f, "high_rolloff_consistency"},
                               {400, 0.2f, "moderate_rolloff_consistency"}}, 3},
    {"spectral_bandwidth_std", {{40, 0.7f, "low_bandwidth_variation"},
                                {90, 0.4f, "moderate_bandwidth_variation"}}, 2},
    {"chroma_std",            {{0.025, 0.8f, "extreme_chroma_consistency"},
                               {0.065, 0.4f, "moderate_chroma_consistency"}}, 2},
    {"spectral_flatness_std", {{0.02, 0.7f, "extreme_flatness_consistency"},
                               {0.05, 0.3f, "moderate_flatness_consistency"}}, 2},
};

// "Too perfect": how many spreads sit below these bounds
struct PerfectBound { const char* feature; double bound; };
const PerfectBound kPerfectBounds[] = {
    {"spectral_centroid_std",  30},
    {"mfcc_std",               8},
    {"zero_crossing_rate_std", 0.008},
    {"rms_std",                0.008},
    {"chroma_std",             0.05},
    {"spectral_rolloff_std",   150},
    {"spectral_bandwidth_std", 70},
    {"spectral_flatness_std",  0.04},
};

struct CountTier { int min_count; float weight; const char* indicator; };
const CountTier kPerfectionTiers[] = {
    {6, 1.5f, "extreme_perfection"},
    {5, 1.0f, "high_perfection"},
    {4, 0.7f, "moderate_perfection"},
    {3, 0.4f, "some_perfection"},
};

constexpr float kSignatureComboWeight = 0.9f;
constexpr float kEnergyComboWeight    = 0.8f;
constexpr double kHeuristicScale      = 3.0;

// ============================================================
// Pattern tables
// ============================================================
constexpr int kFrameLength = 2048;
constexpr int kFrameHop    = 512;

const Tier kEnergyCvTiers[] = {
    {0.3, 0.8f, "extreme_energy_stability"},
    {0.5, 0.5f, "high_energy_stability"},
    {0.7, 0.2f, "moderate_energy_stability"},
};

const Tier kPitchStdTiers[] = {
    {20, 0.7f, "extreme_pitch_stability"},
    {40, 0.4f, "high_pitch_stability"},
    {60, 0.2f, "moderate_pitch_stability"},
};

// ============================================================
// Temporal tables (bound is a strict lower bound here)
// ============================================================
constexpr double kSegmentSeconds = 2.0;
constexpr int    kMaxSegments    = 5;
constexpr int    kSegmentCeps    = 13;

const Tier kSimilarityTiers[] = {
    {0.95, 0.9f, "extreme_segment_similarity"},
    {0.90, 0.7f, "high_segment_similarity"},
    {0.85, 0.5f, "moderate_segment_similarity"},
    {0.80, 0.3f, "some_segment_similarity"},
};

template <size_t N>
const Tier* first_below(double value, const Tier (&tiers)[N]) {
    for (const auto& t : tiers)
        if (value < t.bound) return &t;
    return nullptr;
}

template <size_t N>
const Tier* first_above(double value, const Tier (&tiers)[N]) {
    for (const auto& t : tiers)
        if (value > t.bound) return &t;
    return nullptr;
}

inline float clamp01(double v) {
    return static_cast<float>(std::max(0.0, std::min(1.0, v)));
}

// Run one sub-scorer; an internal failure scores 0
template <typename Fn>
SubScore guarded(const char* name, Fn&& fn) {
    try {
        SubScore s = fn();
        if (!std::isfinite(s.score)) {
            VG_LOG_WARN("{} score is not finite, using 0", name);
            return SubScore{};
        }
        return s;
    } catch (const std::exception& e) {
        VG_LOG_ERROR("{} detection error: {}", name, e.what());
        return SubScore{};
    }
}

std::string join(const std::vector<std::string>& items) {
    std::string s;
    for (const auto& i : items) {
        if (!s.empty()) s += ",";
        s += i;
    }
    return s;
}

} // anonymous namespace

// ============================================================
VoiceCloningDetector::VoiceCloningDetector(int sample_rate,
                                           std::shared_ptr<const CloningModel> model)
    : sample_rate_(sample_rate), model_(std::move(model)) {
    mfcc_.init(sample_rate);
}

VoiceCloningDetector::~VoiceCloningDetector() = default;

// ============================================================
SubScore VoiceCloningDetector::heuristic_score(const FeatureVector& features) {
    SubScore out;
    double raw = 0.0;

    for (const auto& rule : kSpreadRules) {
        double v = features.get(rule.feature);
        for (int i = 0; i < rule.tier_count; ++i) {
            if (v < rule.tiers[i].bound) {
                raw += rule.tiers[i].weight;
                out.indicators.push_back(rule.tiers[i].indicator);
                break;
            }
        }
    }

    int perfect = 0;
    for (const auto& p : kPerfectBounds)
        if (features.get(p.feature) < p.bound) ++perfect;
    for (const auto& t : kPerfectionTiers) {
        if (perfect >= t.min_count) {
            raw += t.weight;
            out.indicators.push_back(t.indicator);
            break;
        }
    }

    const double centroid_std = features.get("spectral_centroid_std");
    const double rolloff_std  = features.get("spectral_rolloff_std");
    const double mfcc_std     = features.get("mfcc_std");
    const double rms_std      = features.get("rms_std");
    const double zcr_std      = features.get("zero_crossing_rate_std");

    if (centroid_std < 35 && rolloff_std < 170 && mfcc_std < 10) {
        raw += kSignatureComboWeight;
        out.indicators.push_back("ai_signature_combo");
    }
    if (rms_std < 0.010 && zcr_std < 0.010 && mfcc_std < 12) {
        raw += kEnergyComboWeight;
        out.indicators.push_back("ai_energy_pattern");
    }

    out.score = static_cast<float>(std::min(1.0, raw / kHeuristicScale));
    VG_LOG_INFO("Heuristic AI score: {:.3f}, Indicators: {}", out.score, out.indicators.size());
    return out;
}

// ============================================================
SubScore VoiceCloningDetector::pattern_score(const std::vector<float>& pcm) const {
    PatternMeasures m;

    // Frame energy stability
    std::vector<float> energies = dsp::frame_energies(pcm, kFrameLength, kFrameHop);
    m.has_energy_cv = dsp::coefficient_of_variation(energies, m.energy_cv);

    // Pitch stability over voiced frames
    dsp::YinOptions yin;
    yin.sample_rate = sample_rate_;
    dsp::PitchTrack track = dsp::track_pitch(pcm, yin);
    m.voiced_frames = track.voiced_frames;
    m.f0_std_hz     = track.std_f0_hz;

    SubScore out = score_pattern(m);
    VG_LOG_INFO("Pattern AI score: {:.3f} (energy_frames={}, voiced_frames={}, f0_std={:.1f})",
                out.score, energies.size(), track.voiced_frames, track.std_f0_hz);
    return out;
}

SubScore VoiceCloningDetector::score_pattern(const PatternMeasures& m) {
    SubScore out;
    double raw = 0.0;
    const Tier* energy = m.has_energy_cv ? energy_stability_tier(m.energy_cv) : nullptr;
    for (const Tier* t : {energy, pitch_stability_tier(m.voiced_frames, m.f0_std_hz)}) {
        if (!t) continue;
        raw += t->weight;
        out.indicators.push_back(t->indicator);
    }
    out.score = clamp01(raw);
    return out;
}

const Tier* VoiceCloningDetector::energy_stability_tier(double energy_cv) {
    return first_below(energy_cv, kEnergyCvTiers);
}

const Tier* VoiceCloningDetector::pitch_stability_tier(int voiced_frames, double f0_std_hz) {
    if (voiced_frames <= kMinVoicedFrames) return nullptr;
    return first_below(f0_std_hz, kPitchStdTiers);
}

const Tier* VoiceCloningDetector::segment_similarity_tier(double mean_similarity) {
    return first_above(mean_similarity, kSimilarityTiers);
}

// ============================================================
SubScore VoiceCloningDetector::temporal_score(const std::vector<float>& pcm) const {
    SubScore out;
    const size_t segment_length = static_cast<size_t>(kSegmentSeconds * sample_rate_);
    const size_t num_segments = segment_length > 0 ? pcm.size() / segment_length : 0;
    if (num_segments < 2) {
        VG_LOG_DEBUG("Temporal analysis skipped: {} full segments", num_segments);
        return out;
    }

    std::vector<std::vector<float>> summaries;
    const size_t used = std::min<size_t>(num_segments, kMaxSegments);
    for (size_t i = 0; i < used; ++i) {
        auto begin = pcm.begin() + static_cast<std::ptrdiff_t>(i * segment_length);
        std::vector<float> segment(begin, begin + static_cast<std::ptrdiff_t>(segment_length));
        std::vector<float> mean = mfcc_.extract_mean(segment, kSegmentCeps);
        if (!mean.empty()) summaries.push_back(std::move(mean));
    }

    float similarity = 0.0f;
    if (!SimilarityCalculator::mean_consecutive_correlation(summaries, similarity)) {
        return out;
    }

    if (const Tier* t = segment_similarity_tier(similarity)) {
        out.score = clamp01(t->weight);
        out.indicators.push_back(t->indicator);
    }
    VG_LOG_INFO("Temporal AI score: {:.3f} ({} segments, mean similarity {:.3f})",
                out.score, summaries.size(), similarity);
    return out;
}

// ============================================================
float VoiceCloningDetector::fuse(float heuristic, float pattern, float temporal) {
    return clamp01(static_cast<double>(heuristic) * kHeuristicWeight +
                   static_cast<double>(pattern) * kPatternWeight +
                   static_cast<double>(temporal) * kTemporalWeight);
}

RiskLevel VoiceCloningDetector::risk_level_for(float confidence) {
    if (confidence > kHighRiskThreshold) return RiskLevel::HIGH;
    if (confidence > kDecisionThreshold) return RiskLevel::MEDIUM;
    return RiskLevel::LOW;
}

VoiceCloningDetectionResult VoiceCloningDetector::fallback() {
    VoiceCloningDetectionResult r;
    r.is_ai_generated  = false;
    r.confidence_score = 0.0f;
    r.risk_level       = RiskLevel::LOW;
    r.detection_method = "error";
    return r;
}

// ============================================================
VoiceCloningDetectionResult VoiceCloningDetector::detect(const Waveform& wav,
                                                         const FeatureVector& features) const {
    if (!features.ok()) {
        VG_LOG_WARN("Voice cloning detection fallback: feature extraction {}",
                    extraction_status_name(features.status()));
        return fallback();
    }

    try {
        std::vector<float> resampled;
        const std::vector<float>* pcm = &wav.samples;
        if (wav.sample_rate != sample_rate_) {
            resampled = AudioProcessor::resample(wav.samples, wav.sample_rate, sample_rate_);
            pcm = &resampled;
        }

        SubScore h = guarded("Heuristic", [&] { return run_heuristic(features); });
        SubScore p = guarded("Pattern",   [&] { return run_pattern(*pcm); });
        SubScore t = guarded("Temporal",  [&] { return run_temporal(*pcm); });

        VoiceCloningDetectionResult r;
        r.confidence_score = fuse(h.score, p.score, t.score);
        r.is_ai_generated  = r.confidence_score > kDecisionThreshold;
        r.risk_level       = risk_level_for(r.confidence_score);
        r.detection_method = "advanced_multi_method";
        r.has_component_scores = true;
        r.component_scores = {h.score, p.score, t.score};
        for (auto* s : {&h, &p, &t})
            r.indicators.insert(r.indicators.end(), s->indicators.begin(), s->indicators.end());

        if (model_ && model_->available()) {
            r.model_score = model_->predict(features.advanced_vector());
        }

        VG_LOG_INFO("AI detection result: {}, confidence: {:.3f}, risk: {}",
                    r.is_ai_generated, r.confidence_score, risk_level_name(r.risk_level));
        VG_LOG_INFO("Component scores - Heuristic: {:.3f}, Pattern: {:.3f}, Temporal: {:.3f}",
                    h.score, p.score, t.score);
        VG_LOG_DEBUG("Indicators: [{}]", join(r.indicators));
        return r;
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Voice cloning detection error: {}", e.what());
        return fallback();
    }
}

} // namespace vg
