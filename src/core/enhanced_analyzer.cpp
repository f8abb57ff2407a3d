#include "core/enhanced_analyzer.h"
#include "core/audio_processor.h"
#include "core/cloning_model.h"
#include "core/feature_extractor.h"
#include "core/language_scorer.h"
#include "core/voice_cloning_detector.h"
#include "utils/logger.h"
#include <ctime>
#include <exception>
#include <future>
#include <utility>
#include <system_error>

namespace vg {

namespace {

LanguageDetectionResult run_language(const LanguageScorer& scorer, const FeatureVector& fv) {
    try {
        return scorer.detect(fv);
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Language branch failed, using fallback: {}", e.what());
        return LanguageScorer::fallback();
    }
}

VoiceCloningDetectionResult run_detector(const VoiceCloningDetector& detector,
                                         const Waveform& wav, const FeatureVector& fv) {
    try {
        return detector.detect(wav, fv);
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Voice cloning branch failed, using fallback: {}", e.what());
        return VoiceCloningDetector::fallback();
    }
}

} // anonymous namespace

// ============================================================
EnhancedAnalyzer::EnhancedAnalyzer(const AnalyzerConfig& config)
    : EnhancedAnalyzer(config, nullptr, nullptr) {}

EnhancedAnalyzer::EnhancedAnalyzer(const AnalyzerConfig& config,
                                   std::unique_ptr<LanguageScorer> language,
                                   std::unique_ptr<VoiceCloningDetector> detector)
    : config_(config)
    , extractor_(std::make_unique<FeatureExtractor>(config.target_sample_rate))
    , language_(std::move(language))
    , detector_(std::move(detector))
    , model_(std::make_shared<CloningModel>()) {
    if (!language_) language_ = std::make_unique<LanguageScorer>();
    if (!detector_)
        detector_ = std::make_unique<VoiceCloningDetector>(config.target_sample_rate, model_);
    VG_LOG_INFO("Enhanced analyzer initialized (rate={}Hz, parallel={})",
                config_.target_sample_rate, config_.parallel);
}

EnhancedAnalyzer::~EnhancedAnalyzer() = default;

bool EnhancedAnalyzer::load_model() {
    if (config_.model_dir.empty()) {
        VG_LOG_DEBUG("No model directory configured, model slot disabled");
        return false;
    }
    return model_->load(config_.model_dir);
}

bool EnhancedAnalyzer::model_loaded() const {
    return model_ && model_->available();
}

// ============================================================
bool EnhancedAnalyzer::load_waveform(const std::string& path, Waveform& out,
                                     std::string& error) const {
    AudioProcessor proc(config_.target_sample_rate);
    out = Waveform{};
    out.sample_rate = config_.target_sample_rate;
    try {
        if (proc.load(path, out)) return true;
        error = proc.last_error();
    } catch (const std::exception& e) {
        error = std::string("WAV decode error: ") + e.what();
    }
    out.samples.clear();
    return false;
}

EnhancedAnalysisResult EnhancedAnalyzer::analyze(const Waveform& wav) const {
    if (wav.sample_rate == config_.target_sample_rate || wav.samples.empty()) {
        return run(wav, true);
    }
    if (wav.sample_rate <= 0) {
        VG_LOG_ERROR("Invalid sample rate {}, analysing as undecodable input", wav.sample_rate);
        return run(Waveform{{}, config_.target_sample_rate}, false);
    }
    Waveform resampled;
    resampled.sample_rate = config_.target_sample_rate;
    resampled.samples = AudioProcessor::resample(wav.samples, wav.sample_rate,
                                                 config_.target_sample_rate);
    return run(resampled, true);
}

EnhancedAnalysisResult EnhancedAnalyzer::analyze_file(const std::string& path,
                                                      std::string* decode_error) const {
    Waveform wav;
    std::string error;
    if (!load_waveform(path, wav, error)) {
        VG_LOG_ERROR("Cannot decode {}: {}", path, error);
        if (decode_error) *decode_error = error;
        return run(wav, false);
    }
    VG_LOG_INFO("Analysing {} ({:.2f}s)", path, wav.duration_sec());
    return run(wav, true);
}

EnhancedAnalysisResult EnhancedAnalyzer::analyze_buffer(const void* data, size_t size,
                                                        std::string* decode_error) const {
    AudioProcessor proc(config_.target_sample_rate);
    Waveform wav;
    wav.sample_rate = config_.target_sample_rate;
    std::string error;
    try {
        if (proc.decode(data, size, wav)) return run(wav, true);
        error = proc.last_error();
    } catch (const std::exception& e) {
        error = std::string("WAV decode error: ") + e.what();
    }
    VG_LOG_ERROR("Cannot decode WAV buffer ({} bytes): {}", size, error);
    if (decode_error) *decode_error = error;
    wav.samples.clear();
    return run(wav, false);
}

LanguageDetectionResult EnhancedAnalyzer::detect_language(const Waveform& wav) const {
    try {
        return run_language(*language_, extractor_->extract(wav));
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Language detection failed: {}", e.what());
        return LanguageScorer::fallback();
    }
}

VoiceCloningDetectionResult EnhancedAnalyzer::detect_voice_cloning(const Waveform& wav) const {
    try {
        return run_detector(*detector_, wav, extractor_->extract(wav));
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Voice cloning detection failed: {}", e.what());
        return VoiceCloningDetector::fallback();
    }
}

// ============================================================
// Pipeline: features once, then both branches
// ============================================================
EnhancedAnalysisResult EnhancedAnalyzer::run(const Waveform& wav, bool decoded) const {
    EnhancedAnalysisResult result;
    result.metadata.multilingual_support = decoded;
    result.metadata.ai_detection_enabled = decoded;

    try {
        result.metadata.analysis_timestamp = utc_timestamp();
        const FeatureVector features = extractor_->extract(wav);

        if (config_.parallel) {
            std::future<VoiceCloningDetectionResult> pending;
            bool launched = false;
            try {
                pending = std::async(std::launch::async, [this, &wav, &features] {
                    return run_detector(*detector_, wav, features);
                });
                launched = true;
            } catch (const std::system_error& e) {
                VG_LOG_WARN("Cannot start detection worker ({}), running sequentially", e.what());
            }

            result.language = run_language(*language_, features);

            if (launched) {
                try {
                    result.voice_cloning = pending.get();
                } catch (const std::exception& e) {
                    VG_LOG_ERROR("Detection worker failed, using fallback: {}", e.what());
                    result.voice_cloning = VoiceCloningDetector::fallback();
                }
            } else {
                result.voice_cloning = run_detector(*detector_, wav, features);
            }
        } else {
            result.language = run_language(*language_, features);
            result.voice_cloning = run_detector(*detector_, wav, features);
        }
    } catch (const std::exception& e) {
        VG_LOG_ERROR("Enhanced analysis error: {}", e.what());
        result.language = LanguageScorer::fallback();
        result.voice_cloning = VoiceCloningDetector::fallback();
        result.metadata.multilingual_support = false;
        result.metadata.ai_detection_enabled = false;
    }
    return result;
}

std::string EnhancedAnalyzer::utc_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &now);
#else
    gmtime_r(&now, &tm_utc);
#endif
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return std::string(buf, n);
}

} // namespace vg
