#include "core/cloning_model.h"
#include "utils/logger.h"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#ifdef _WIN32
#include <Windows.h>
#endif

namespace vg {

namespace {

inline float sigmoid(float x) { return 1.0f / (1.0f + std::exp(-x)); }

// Two-class softmax, one probability, or one logit.
float to_probability(const float* out, size_t n) {
    if (n >= 2) {
        float m = std::max(out[0], out[1]);
        float e0 = std::exp(out[0] - m), e1 = std::exp(out[1] - m);
        return e1 / (e0 + e1);
    }
    if (out[0] >= 0.0f && out[0] <= 1.0f) return out[0];
    return sigmoid(out[0]);
}

std::unique_ptr<Ort::Session> open_session(Ort::Env& env, const std::string& path,
                                           const Ort::SessionOptions& options) {
#ifdef _WIN32
    int wlen = MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, nullptr, 0);
    std::wstring wpath(wlen, 0);
    MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, &wpath[0], wlen);
    return std::make_unique<Ort::Session>(env, wpath.c_str(), options);
#else
    return std::make_unique<Ort::Session>(env, path.c_str(), options);
#endif
}

} // anonymous namespace

CloningModel::CloningModel() = default;
CloningModel::~CloningModel() = default;

bool CloningModel::load(const std::string& model_dir, int num_threads) {
    namespace fs = std::filesystem;
    session_.reset();
    input_width_ = -1;
    if (model_dir.empty()) return false;

    std::string path = (fs::path(model_dir) / kFileName).string();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        last_error_ = "Optional model not found: " + path;
        VG_LOG_WARN("Optional model not found (model score disabled): {}", path);
        return false;
    }

    try {
        if (!env_) env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "voxguard");

        Ort::SessionOptions options;
        options.SetIntraOpNumThreads(std::max(1, num_threads));
        options.SetInterOpNumThreads(1);
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        auto session = open_session(*env_, path, options);

        if (session->GetInputCount() < 1 || session->GetOutputCount() < 1) {
            last_error_ = "Model has no input or output: " + path;
            VG_LOG_WARN(last_error_);
            return false;
        }

        Ort::AllocatorWithDefaultOptions allocator;
        input_name_  = session->GetInputNameAllocated(0, allocator).get();
        output_name_ = session->GetOutputNameAllocated(0, allocator).get();

        auto shape = session->GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
        if (!shape.empty() && shape.back() > 0) input_width_ = shape.back();

        session_ = std::move(session);
    } catch (const Ort::Exception& e) {
        last_error_ = std::string("ONNX load error: ") + e.what();
        VG_LOG_WARN("Failed to load model {}: {}", path, last_error_);
        return false;
    }

    VG_LOG_INFO("Loaded model: {} (input={}, width={}, output={})",
                path, input_name_, input_width_, output_name_);
    return true;
}

float CloningModel::predict(const std::vector<float>& features) const {
    if (!session_ || features.empty()) return -1.0f;
    if (input_width_ > 0 && static_cast<int64_t>(features.size()) != input_width_) {
        VG_LOG_WARN("Model expects {} features, got {}", input_width_, features.size());
        return -1.0f;
    }

    try {
        auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
        std::vector<int64_t> shape = {1, static_cast<int64_t>(features.size())};
        Ort::Value input = Ort::Value::CreateTensor<float>(
            memory_info, const_cast<float*>(features.data()), features.size(),
            shape.data(), shape.size());

        const char* input_name = input_name_.c_str();
        const char* output_name = output_name_.c_str();

        std::lock_guard<std::mutex> lock(run_mutex_);
        auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                     &input_name, &input, 1, &output_name, 1);

        size_t n = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
        if (n == 0) {
            VG_LOG_WARN("Voice cloning model returned no output");
            return -1.0f;
        }
        float p = to_probability(outputs[0].GetTensorData<float>(), n);
        if (!std::isfinite(p)) return -1.0f;
        return std::min(1.0f, std::max(0.0f, p));
    } catch (const Ort::Exception& e) {
        VG_LOG_ERROR("ONNX inference error: {}", e.what());
        return -1.0f;
    }
}

} // namespace vg
