#ifndef VG_CLONING_MODEL_H
#define VG_CLONING_MODEL_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Ort {
struct Env;
struct Session;
}

namespace vg {

/**
 * Optional learned synthetic-voice classifier (voice_cloning.onnx).
 * Input:  [1, N] advanced feature vector (first input of the graph).
 * Output: one logit/probability, or two-class scores (index 1 = synthetic).
 * Its probability is reported alongside the heuristic decision and never
 * changes it.
 */
class CloningModel {
public:
    static constexpr const char* kFileName = "voice_cloning.onnx";

    CloningModel();
    ~CloningModel();

    // Load <model_dir>/voice_cloning.onnx. False (model slot stays empty)
    // when the file is absent or cannot be loaded.
    bool load(const std::string& model_dir, int num_threads = 1);

    bool available() const { return session_ != nullptr; }

    // Feature width declared by the graph, -1 when dynamic or not loaded.
    int64_t input_width() const { return input_width_; }

    // Synthetic probability in [0,1], or -1 when unavailable or on failure.
    float predict(const std::vector<float>& features) const;

    const std::string& last_error() const { return last_error_; }

private:
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;
    std::string input_name_;
    std::string output_name_;
    int64_t input_width_ = -1;
    mutable std::mutex run_mutex_;
    std::string last_error_;
};

} // namespace vg

#endif // VG_CLONING_MODEL_H
