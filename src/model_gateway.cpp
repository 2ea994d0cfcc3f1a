#include "internal/model_gateway.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/alphabet_codec.hpp"

namespace niqqud {

ModelGateway::ModelGateway(const NiqqudConfig& config)
    : ModelGateway([backend = config.backend]() {
                       return NiqqudBackendFactory::create(backend);
                   },
                   config) {
}

ModelGateway::ModelGateway(BackendFactory factory, const NiqqudConfig& config)
    : factory_(std::move(factory)), config_(config) {
}

ModelGateway::~ModelGateway() {
    if (backend_) {
        backend_->shutdown();
    }
}

// =============================================================================
// 模型加载
// =============================================================================

ErrorInfo ModelGateway::acquire() {
    std::call_once(load_once_, [this]() { load(); });
    return load_result_;
}

void ModelGateway::load() {
    auto start = std::chrono::high_resolution_clock::now();

    backend_ = factory_ ? factory_() : nullptr;
    if (!backend_) {
        std::string available;
        for (auto type : NiqqudBackendFactory::getAvailableBackends()) {
            available += (available.empty() ? "" : ", ") +
                         std::string(NiqqudBackendFactory::getBackendName(type));
        }
        load_result_ = ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
            std::string("Failed to create backend: ") + backendTypeToString(config_.backend),
            "available: " + available);
        std::cerr << "[Nakdan] " << load_result_.message << std::endl;
        return;
    }

    auto err = backend_->initialize(config_);
    if (!err.isOk()) {
        load_result_ = ErrorInfo::error(ErrorCode::MODEL_LOAD_FAILED, err.message,
            std::string(errorCodeToString(err.code)) +
            (err.detail.empty() ? "" : ": " + err.detail));
        std::cerr << "[Nakdan] Model load failed: " << err.message << std::endl;
        backend_.reset();
        return;
    }

    loaded_ = true;
    load_result_ = ErrorInfo::ok();

    auto end = std::chrono::high_resolution_clock::now();
    auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << "[Nakdan] Backend ready: " << backend_->getName()
              << " v" << backend_->getVersion()
              << " (" << dur.count() << "ms)" << std::endl;
}

// =============================================================================
// 推理
// =============================================================================

ErrorInfo ModelGateway::predict(const std::vector<int64_t>& indices,
                                ChannelPredictions& predictions) {
    auto err = acquire();
    if (!err.isOk()) {
        return ErrorInfo::error(ErrorCode::PREDICTION_FAILED,
            "Model unavailable: " + err.message, err.detail);
    }

    auto length = backend_->getMaxLength();
    if (static_cast<int64_t>(indices.size()) > length) {
        return ErrorInfo::error(ErrorCode::PREDICTION_FAILED,
            "Input of " + std::to_string(indices.size()) +
            " symbols exceeds model length " + std::to_string(length));
    }

    std::vector<int64_t> padded(indices);
    padded.resize(static_cast<size_t>(length), text::AlphabetCodec::MASK_INDEX);

    err = backend_->predict(padded, predictions);
    if (!err.isOk()) {
        return err;
    }

    // 每个填充后位置必须恰好一行
    for (auto check : {
             checkChannel(predictions.niqqud, "niqqud", length, text::AlphabetCodec::NIQQUD_CLASSES),
             checkChannel(predictions.dagesh, "dagesh", length, text::AlphabetCodec::DAGESH_CLASSES),
             checkChannel(predictions.sin, "sin", length, text::AlphabetCodec::SIN_CLASSES)}) {
        if (!check.isOk()) {
            return check;
        }
    }
    return ErrorInfo::ok();
}

ErrorInfo ModelGateway::checkChannel(const ScoreMatrix& scores, const char* name,
                                     int64_t rows, int64_t cols) {
    if (scores.isEmpty() || scores.rows != rows || scores.cols != cols ||
        scores.data.size() != static_cast<size_t>(scores.rows * scores.cols)) {
        return ErrorInfo::error(ErrorCode::PREDICTION_FAILED,
            std::string("Malformed ") + name + " output: got [" +
            std::to_string(scores.rows) + " x " + std::to_string(scores.cols) + "] with " +
            std::to_string(scores.data.size()) + " values, expected [" +
            std::to_string(rows) + " x " + std::to_string(cols) + "]");
    }
    return ErrorInfo::ok();
}

// =============================================================================
// 状态查询
// =============================================================================

bool ModelGateway::isLoaded() const {
    return loaded_;
}

int64_t ModelGateway::maxLength() {
    if (acquire().isOk()) {
        return backend_->getMaxLength();
    }
    return config_.max_length;
}

std::string ModelGateway::backendName() const {
    return loaded_ ? backend_->getName() : "";
}

}  // namespace niqqud
