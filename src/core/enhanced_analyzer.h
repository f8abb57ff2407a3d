#ifndef VG_ENHANCED_ANALYZER_H
#define VG_ENHANCED_ANALYZER_H

#include "core/analysis_types.h"
#include "core/waveform.h"
#include "utils/config.h"
#include <memory>
#include <string>
#include <vector>

namespace vg {

class AudioProcessor;
class CloningModel;
class FeatureExtractor;
class LanguageScorer;
class VoiceCloningDetector;

/**
 * EnhancedAnalyzer runs the full screening pipeline on one clip:
 *   - decode (file / WAV buffer) and resample to the analysis rate
 *   - extract the feature vector once
 *   - language scoring and synthetic-voice detection, concurrently when
 *     configured, sequentially otherwise
 *
 * No analysis call throws. A branch that fails is replaced by its fallback
 * result while the other branch's result is kept. Calls share no mutable
 * state and may run concurrently.
 */
class EnhancedAnalyzer {
public:
    explicit EnhancedAnalyzer(const AnalyzerConfig& config = AnalyzerConfig());
    // Replace either branch; a null pointer keeps the built-in one. An
    // injected detector does not see the model loaded by load_model().
    EnhancedAnalyzer(const AnalyzerConfig& config,
                     std::unique_ptr<LanguageScorer> language,
                     std::unique_ptr<VoiceCloningDetector> detector);
    ~EnhancedAnalyzer();

    /**
     * Load the optional model slot from config.model_dir.
     * @return true when a model was loaded; false leaves the slot empty.
     */
    bool load_model();

    EnhancedAnalysisResult analyze(const Waveform& wav) const;
    // Decode first; on failure both branches report their fallbacks, the
    // metadata flags are cleared and `decode_error` (if given) says why.
    EnhancedAnalysisResult analyze_file(const std::string& path,
                                        std::string* decode_error = nullptr) const;
    EnhancedAnalysisResult analyze_buffer(const void* data, size_t size,
                                          std::string* decode_error = nullptr) const;

    LanguageDetectionResult     detect_language(const Waveform& wav) const;
    VoiceCloningDetectionResult detect_voice_cloning(const Waveform& wav) const;

    // Decode a WAV file to the analysis rate. False (and an empty waveform)
    // on failure; `error` then describes the problem.
    bool load_waveform(const std::string& path, Waveform& out, std::string& error) const;

    const AnalyzerConfig& config() const { return config_; }
    bool model_loaded() const;

    // UTC ISO-8601 timestamp, e.g. 2024-05-01T12:30:00Z
    static std::string utc_timestamp();

private:
    EnhancedAnalysisResult run(const Waveform& wav, bool decoded) const;

    AnalyzerConfig config_;
    std::unique_ptr<FeatureExtractor>     extractor_;
    std::unique_ptr<LanguageScorer>       language_;
    std::unique_ptr<VoiceCloningDetector> detector_;
    std::shared_ptr<CloningModel>         model_;
};

} // namespace vg

#endif // VG_ENHANCED_ANALYZER_H
