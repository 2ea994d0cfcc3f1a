#ifndef NIQQUD_NAKDIMON_BACKEND_HPP
#define NIQQUD_NAKDIMON_BACKEND_HPP

#include <onnxruntime_cxx_api.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/backends/niqqud_backend.hpp"

namespace niqqud {

// =============================================================================
// NakdimonBackend - Nakdimon 字符模型 (ONNX Runtime)
// =============================================================================
//
// 单个 ONNX 模型:
//   input  : [1, L]        字符索引 (int32 / int64 / float, 以模型声明为准)
//   niqqud : [1, L, 16]    元音分数
//   dagesh : [1, L, 3]     dagesh 分数
//   sin    : [1, L, 4]     shin/sin 点分数
//
// L 为模型声明的固定长度; 模型为动态长度时使用配置中的 max_length。
//

class NakdimonBackend : public INiqqudBackend {
public:
    static constexpr const char* INPUT_NAME = "input";
    static constexpr const char* NIQQUD_OUTPUT = "niqqud";
    static constexpr const char* DAGESH_OUTPUT = "dagesh";
    static constexpr const char* SIN_OUTPUT = "sin";

    NakdimonBackend();
    ~NakdimonBackend() override;

    // -------------------------------------------------------------------------
    // INiqqudBackend interface
    // -------------------------------------------------------------------------

    ErrorInfo initialize(const NiqqudConfig& config) override;
    void shutdown() override;
    bool isInitialized() const override;

    BackendType getType() const override;
    std::string getName() const override;
    std::string getVersion() const override;
    int64_t getMaxLength() const override;

    ErrorInfo predict(const std::vector<int64_t>& indices,
                      ChannelPredictions& predictions) override;

private:
    /// @brief 读取输入名、元素类型与固定长度
    ErrorInfo inspectModel();

    /// @brief 运行 ONNX 推理
    ChannelPredictions runInference(const std::vector<int64_t>& indices);

    /// @brief 将输出张量复制为分数矩阵
    static ScoreMatrix toScoreMatrix(Ort::Value& tensor);

    /// @brief 预热模型
    void warmUpModel();

    // ONNX Runtime
    std::unique_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> session_;

    // 模型输入信息
    std::string input_name_ = INPUT_NAME;
    ONNXTensorElementDataType input_type_ = ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32;
    int64_t max_length_ = 0;

    // State
    NiqqudConfig config_;
    bool initialized_ = false;
};

}  // namespace niqqud

#endif  // NIQQUD_NAKDIMON_BACKEND_HPP
