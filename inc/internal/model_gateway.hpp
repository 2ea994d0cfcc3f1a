#ifndef NIQQUD_MODEL_GATEWAY_HPP
#define NIQQUD_MODEL_GATEWAY_HPP

#include <cstdint>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/backends/niqqud_backend.hpp"
#include "internal/niqqud_config.hpp"
#include "internal/niqqud_types.hpp"

namespace niqqud {

// =============================================================================
// ModelGateway - 模型会话的唯一入口
// =============================================================================
//
// - 首次使用时加载模型 (std::call_once), 之后复用同一个后端
// - 加载结果 (包括失败) 在对象生命周期内缓存, 不会重试
// - 输入右侧用 MASK 填充到后端要求的固定长度
// - 加载完成后 predict() 可被多个线程并发调用
//

class ModelGateway {
public:
    using BackendFactory = std::function<std::unique_ptr<INiqqudBackend>()>;

    /// @brief 使用 NiqqudBackendFactory 按 config.backend 创建后端
    explicit ModelGateway(const NiqqudConfig& config);

    /// @brief 使用自定义工厂 (测试或 CUSTOM 后端)
    ModelGateway(BackendFactory factory, const NiqqudConfig& config);

    ~ModelGateway();

    ModelGateway(const ModelGateway&) = delete;
    ModelGateway& operator=(const ModelGateway&) = delete;

    /**
     * @brief 加载模型 (只执行一次)
     * @return 加载结果; 失败时 code 为 MODEL_LOAD_FAILED 或 INTERNAL_ERROR
     */
    ErrorInfo acquire();

    /**
     * @brief 运行模型
     * @param indices 已编码的索引, 长度不得超过 maxLength()
     * @param predictions [out] 每个填充后位置一行
     * @return 加载失败、推理失败或输出形状不符时返回 PREDICTION_FAILED
     */
    ErrorInfo predict(const std::vector<int64_t>& indices, ChannelPredictions& predictions);

    /// @brief 模型是否已成功加载
    bool isLoaded() const;

    /// @brief 模型输入长度 (加载前为配置值)
    int64_t maxLength();

    /// @brief 后端名称 (未加载时为空)
    std::string backendName() const;

    const NiqqudConfig& config() const { return config_; }

private:
    void load();

    /// @brief 检查单个通道的形状 [rows x cols] 与数据长度
    static ErrorInfo checkChannel(const ScoreMatrix& scores, const char* name,
                                  int64_t rows, int64_t cols);

    BackendFactory factory_;
    NiqqudConfig config_;

    std::once_flag load_once_;
    std::unique_ptr<INiqqudBackend> backend_;
    ErrorInfo load_result_ = ErrorInfo::ok();
    std::atomic<bool> loaded_{false};
};

}  // namespace niqqud

#endif  // NIQQUD_MODEL_GATEWAY_HPP
