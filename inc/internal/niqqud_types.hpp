#ifndef NIQQUD_TYPES_HPP
#define NIQQUD_TYPES_HPP

#include <cstdint>

#include <string>
#include <vector>

namespace niqqud {

// =============================================================================
// Backend Type (后端类型)
// =============================================================================

enum class BackendType {
    NAKDIMON,           // Nakdimon character model (ONNX)
    CUSTOM,             // injected by the caller
};

inline const char* backendTypeToString(BackendType type) {
    switch (type) {
        case BackendType::NAKDIMON: return "nakdimon";
        case BackendType::CUSTOM:   return "custom";
        default:                    return "unknown";
    }
}

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
    MODEL_NOT_FOUND = 101,

    // 运行时错误 (2xx)
    NOT_INITIALIZED = 200,
    ALREADY_STARTED = 201,
    PREDICTION_FAILED = 203,
    CANCELLED = 206,
    MODEL_LOAD_FAILED = 207,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                 return "OK";
        case ErrorCode::INVALID_CONFIG:     return "INVALID_CONFIG";
        case ErrorCode::MODEL_NOT_FOUND:    return "MODEL_NOT_FOUND";
        case ErrorCode::NOT_INITIALIZED:    return "NOT_INITIALIZED";
        case ErrorCode::ALREADY_STARTED:    return "ALREADY_STARTED";
        case ErrorCode::PREDICTION_FAILED:  return "PREDICTION_FAILED";
        case ErrorCode::CANCELLED:          return "CANCELLED";
        case ErrorCode::MODEL_LOAD_FAILED:  return "MODEL_LOAD_FAILED";
        case ErrorCode::INTERNAL_ERROR:     return "INTERNAL_ERROR";
        default:                            return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(调试用)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

// =============================================================================
// Score Matrix (单通道预测分数)
// =============================================================================

/// Row-major [rows x cols] class scores for one output channel.
/// One row per input position, one column per class.
struct ScoreMatrix {
    std::vector<float> data;
    int64_t rows = 0;
    int64_t cols = 0;

    float at(int64_t row, int64_t col) const {
        return data[static_cast<size_t>(row * cols + col)];
    }

    bool isEmpty() const {
        return rows == 0 || cols == 0;
    }

    static ScoreMatrix zeros(int64_t rows, int64_t cols) {
        ScoreMatrix m;
        m.rows = rows;
        m.cols = cols;
        m.data.assign(static_cast<size_t>(rows * cols), 0.0f);
        return m;
    }
};

// =============================================================================
// Channel Predictions (三通道模型输出)
// =============================================================================

struct ChannelPredictions {
    ScoreMatrix niqqud;
    ScoreMatrix dagesh;
    ScoreMatrix sin;
};

// =============================================================================
// Generation State (生成状态机)
// =============================================================================

enum class GenerationState {
    IDLE,           // nothing pending
    DEBOUNCING,     // waiting for the quiet interval
    RUNNING,        // model pipeline in flight
    COMPLETED,      // last request produced output
    FAILED,         // last request produced an error
};

inline const char* generationStateToString(GenerationState state) {
    switch (state) {
        case GenerationState::IDLE:       return "idle";
        case GenerationState::DEBOUNCING: return "debouncing";
        case GenerationState::RUNNING:    return "running";
        case GenerationState::COMPLETED:  return "completed";
        case GenerationState::FAILED:     return "failed";
        default:                          return "unknown";
    }
}

// =============================================================================
// Generation Result (生成结果)
// =============================================================================

struct GenerationResult {
    uint64_t request_id = 0;            // 请求ID (对应 generate() 返回值)
    std::string text;                   // 加注音符号后的文本
    bool success = false;
    ErrorInfo error = ErrorInfo::ok();
    int64_t processing_time_ms = 0;     // 处理耗时 (毫秒)
};

// =============================================================================
// Callback Interface (回调接口)
// =============================================================================

class IGenerationCallback {
public:
    virtual ~IGenerationCallback() = default;

    /// @brief 生成成功
    /// @param result 结果 (request_id 为最新请求)
    virtual void onResult(const GenerationResult& result) {}

    /// @brief 生成失败
    /// @param result 结果, error 字段包含失败原因
    virtual void onError(const GenerationResult& result) {}
};

}  // namespace niqqud

#endif  // NIQQUD_TYPES_HPP
