#include "internal/backends/nakdimon/nakdimon_backend.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <filesystem>  // NOLINT(build/c++17)
#include <functional>
#include <iostream>
#include <memory>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace niqqud {

// =============================================================================
// Construction / Destruction
// =============================================================================

NakdimonBackend::NakdimonBackend()
    : initialized_(false) {
}

NakdimonBackend::~NakdimonBackend() {
    shutdown();
}

// =============================================================================
// Lifecycle
// =============================================================================

ErrorInfo NakdimonBackend::initialize(const NiqqudConfig& config) {
    if (initialized_) {
        return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Backend already initialized");
    }

    auto err = config.validate();
    if (!err.isOk()) {
        return err;
    }
    config_ = config;

    std::string model_path = config_.getExpandedModelPath();
    if (!fs::exists(model_path)) {
        return ErrorInfo::error(ErrorCode::MODEL_NOT_FOUND,
            "Nakdimon model not found at: " + model_path);
    }

    try {
        // Initialize ONNX Runtime (suppress stderr warnings)
        int stderr_fd = dup(STDERR_FILENO);
        int devnull_fd = open("/dev/null", O_WRONLY);
        if (stderr_fd >= 0 && devnull_fd >= 0) {
            dup2(devnull_fd, STDERR_FILENO);
        }

        env_ = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "NakdimonBackend");

        // Restore stderr
        if (stderr_fd >= 0) {
            dup2(stderr_fd, STDERR_FILENO);
            close(stderr_fd);
        }
        if (devnull_fd >= 0) {
            close(devnull_fd);
        }

        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(config_.num_threads > 0 ? config_.num_threads : 2);
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        #if defined(__riscv) || defined(__riscv__)
        session_options.DisableMemPattern();
        session_options.DisableCpuMemArena();
        #endif

        session_ = std::make_unique<Ort::Session>(*env_, model_path.c_str(), session_options);

        err = inspectModel();
        if (!err.isOk()) {
            session_.reset();
            env_.reset();
            return err;
        }

        if (config_.enable_warmup) {
            warmUpModel();
        }

        initialized_ = true;

        std::cout << "[Nakdimon] Model loaded from " << model_path
            << " (input length " << max_length_ << ")" << std::endl;
        return ErrorInfo::ok();
    } catch (const Ort::Exception& e) {
        session_.reset();
        env_.reset();
        return ErrorInfo::error(ErrorCode::MODEL_LOAD_FAILED,
            std::string("Failed to initialize Nakdimon model: ") + e.what(), model_path);
    } catch (const std::exception& e) {
        session_.reset();
        env_.reset();
        return ErrorInfo::error(ErrorCode::MODEL_LOAD_FAILED,
            std::string("Failed to initialize Nakdimon model: ") + e.what(), model_path);
    }
}

void NakdimonBackend::shutdown() {
    if (initialized_) {
        session_.reset();
        env_.reset();
        initialized_ = false;
    }
}

bool NakdimonBackend::isInitialized() const {
    return initialized_;
}

// =============================================================================
// Backend Info
// =============================================================================

BackendType NakdimonBackend::getType() const {
    return BackendType::NAKDIMON;
}

std::string NakdimonBackend::getName() const {
    return "Nakdimon (Hebrew diacritization)";
}

std::string NakdimonBackend::getVersion() const {
    return "1.0.0";
}

int64_t NakdimonBackend::getMaxLength() const {
    return max_length_ > 0 ? max_length_ : config_.max_length;
}

// =============================================================================
// Prediction
// =============================================================================

ErrorInfo NakdimonBackend::predict(const std::vector<int64_t>& indices,
                                   ChannelPredictions& predictions) {
    if (!initialized_) {
        return ErrorInfo::error(ErrorCode::NOT_INITIALIZED, "Backend not initialized");
    }

    if (static_cast<int64_t>(indices.size()) != getMaxLength()) {
        return ErrorInfo::error(ErrorCode::PREDICTION_FAILED,
            "Input length " + std::to_string(indices.size()) +
            " does not match model length " + std::to_string(getMaxLength()));
    }

    try {
        predictions = runInference(indices);
        return ErrorInfo::ok();
    } catch (const Ort::Exception& e) {
        return ErrorInfo::error(ErrorCode::PREDICTION_FAILED,
            std::string("Nakdimon inference failed: ") + e.what());
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::PREDICTION_FAILED,
            std::string("Nakdimon inference failed: ") + e.what());
    }
}

// =============================================================================
// Private Methods
// =============================================================================

ErrorInfo NakdimonBackend::inspectModel() {
    Ort::AllocatorWithDefaultOptions allocator;

    size_t input_count = session_->GetInputCount();
    if (input_count == 0) {
        return ErrorInfo::error(ErrorCode::MODEL_LOAD_FAILED, "Model declares no inputs");
    }

    // Prefer the input named "input", otherwise take the first one
    size_t input_index = 0;
    for (size_t i = 0; i < input_count; ++i) {
        auto name = session_->GetInputNameAllocated(i, allocator);
        if (std::string(name.get()) == INPUT_NAME) {
            input_index = i;
            break;
        }
    }
    input_name_ = session_->GetInputNameAllocated(input_index, allocator).get();

    auto type_info = session_->GetInputTypeInfo(input_index);
    auto tensor_info = type_info.GetTensorTypeAndShapeInfo();
    input_type_ = tensor_info.GetElementType();
    if (input_type_ != ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32 &&
        input_type_ != ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64 &&
        input_type_ != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        return ErrorInfo::error(ErrorCode::MODEL_LOAD_FAILED,
            "Unsupported input element type: " + std::to_string(static_cast<int>(input_type_)));
    }

    auto shape = tensor_info.GetShape();
    if (shape.size() >= 2 && shape[1] > 0) {
        max_length_ = shape[1];
    } else {
        max_length_ = config_.max_length;
    }

    std::vector<std::string> output_names;
    for (size_t i = 0; i < session_->GetOutputCount(); ++i) {
        output_names.emplace_back(session_->GetOutputNameAllocated(i, allocator).get());
    }
    for (const char* required : {NIQQUD_OUTPUT, DAGESH_OUTPUT, SIN_OUTPUT}) {
        bool found = false;
        for (const auto& name : output_names) {
            if (name == required) {
                found = true;
                break;
            }
        }
        if (!found) {
            return ErrorInfo::error(ErrorCode::MODEL_LOAD_FAILED,
                std::string("Model output missing: ") + required);
        }
    }

    return ErrorInfo::ok();
}

ChannelPredictions NakdimonBackend::runInference(const std::vector<int64_t>& indices) {
    auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    // Input: [1, L]
    std::vector<int64_t> input_shape = {1, static_cast<int64_t>(indices.size())};
    std::vector<int32_t> indices_i32;
    std::vector<float> indices_f32;
    Ort::Value input_tensor{nullptr};

    switch (input_type_) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64:
            input_tensor = Ort::Value::CreateTensor<int64_t>(
                memory_info, const_cast<int64_t*>(indices.data()), indices.size(),
                input_shape.data(), input_shape.size());
            break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
            indices_f32.assign(indices.begin(), indices.end());
            input_tensor = Ort::Value::CreateTensor<float>(
                memory_info, indices_f32.data(), indices_f32.size(),
                input_shape.data(), input_shape.size());
            break;
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32:
        default:
            indices_i32.assign(indices.begin(), indices.end());
            input_tensor = Ort::Value::CreateTensor<int32_t>(
                memory_info, indices_i32.data(), indices_i32.size(),
                input_shape.data(), input_shape.size());
            break;
    }

    const char* input_names[] = {input_name_.c_str()};
    const char* output_names[] = {NIQQUD_OUTPUT, DAGESH_OUTPUT, SIN_OUTPUT};

    // Ort::Session::Run is safe to call concurrently on one session
    auto output_tensors = session_->Run(
        Ort::RunOptions{nullptr},
        input_names, &input_tensor, 1,
        output_names, 3);

    ChannelPredictions predictions;
    predictions.niqqud = toScoreMatrix(output_tensors[0]);
    predictions.dagesh = toScoreMatrix(output_tensors[1]);
    predictions.sin = toScoreMatrix(output_tensors[2]);
    return predictions;
}

ScoreMatrix NakdimonBackend::toScoreMatrix(Ort::Value& tensor) {
    auto info = tensor.GetTensorTypeAndShapeInfo();
    if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
        throw std::runtime_error("Model output is not float32");
    }

    // [1, L, C] or [L, C]
    auto shape = info.GetShape();
    if (shape.size() < 2) {
        throw std::runtime_error("Model output has rank " + std::to_string(shape.size()));
    }

    size_t count = std::accumulate(shape.begin(), shape.end(),
        static_cast<size_t>(1), [](size_t acc, int64_t dim) {
            return acc * static_cast<size_t>(dim);
        });

    ScoreMatrix matrix;
    matrix.cols = shape[shape.size() - 1];
    matrix.rows = shape[shape.size() - 2];
    const float* data = tensor.GetTensorData<float>();
    matrix.data.assign(data, data + count);
    return matrix;
}

void NakdimonBackend::warmUpModel() {
    std::cout << "[Nakdimon] Warming up model..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    try {
        // "שלום" padded with MASK
        std::vector<int64_t> indices(static_cast<size_t>(getMaxLength()), 0);
        const int64_t sample[] = {41, 28, 21, 29};
        for (size_t i = 0; i < 4 && i < indices.size(); ++i) {
            indices[i] = sample[i];
        }
        runInference(indices);

        auto end = std::chrono::high_resolution_clock::now();
        auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
        std::cout << "[Nakdimon] Model warmed up in " << dur.count() << "ms" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[Nakdimon] Warning: warm-up failed: " << e.what() << std::endl;
    }
}

}  // namespace niqqud
