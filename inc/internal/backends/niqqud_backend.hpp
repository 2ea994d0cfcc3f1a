#ifndef NIQQUD_BACKEND_HPP
#define NIQQUD_BACKEND_HPP

#include <cstdint>

#include <memory>
#include <string>
#include <vector>

#include "internal/niqqud_config.hpp"
#include "internal/niqqud_types.hpp"

namespace niqqud {

// =============================================================================
// Niqqud Backend Interface (预测后端抽象接口)
// =============================================================================
//
// 所有预测后端必须实现此接口。后端只负责模型会话本身:
// 输入为已填充到固定长度的索引序列, 输出为三通道分数矩阵。
// 分段、编码、解码由上层完成。
//
// 实现新后端的步骤:
// 1. 继承 INiqqudBackend
// 2. 实现所有纯虚函数
// 3. 在 NiqqudBackendFactory 中注册
//
// 已实现的后端:
// - NakdimonBackend: Nakdimon 字符模型 (ONNX Runtime)
//

class INiqqudBackend {
public:
    virtual ~INiqqudBackend() = default;

    // -------------------------------------------------------------------------
    // 生命周期管理
    // -------------------------------------------------------------------------

    /// @brief 初始化后端 (加载模型)
    /// @param config 配置参数
    /// @return 错误信息, OK表示成功
    virtual ErrorInfo initialize(const NiqqudConfig& config) = 0;

    /// @brief 释放资源
    virtual void shutdown() = 0;

    /// @brief 检查是否已初始化
    virtual bool isInitialized() const = 0;

    // -------------------------------------------------------------------------
    // 后端信息
    // -------------------------------------------------------------------------

    /// @brief 获取后端类型
    virtual BackendType getType() const = 0;

    /// @brief 获取后端名称 (用于日志)
    virtual std::string getName() const = 0;

    /// @brief 获取后端版本
    virtual std::string getVersion() const = 0;

    /// @brief 模型要求的固定输入长度
    virtual int64_t getMaxLength() const = 0;

    // -------------------------------------------------------------------------
    // 推理
    // -------------------------------------------------------------------------

    /// @brief 运行模型
    /// @param indices 长度等于 getMaxLength() 的索引序列
    /// @param predictions [out] 三通道分数, 每个输入位置一行
    /// @return 错误信息
    /// @note 初始化完成后可被多个线程同时调用
    virtual ErrorInfo predict(const std::vector<int64_t>& indices,
                              ChannelPredictions& predictions) = 0;
};

// =============================================================================
// Backend Factory (后端工厂)
// =============================================================================

class NiqqudBackendFactory {
public:
    /// @brief 创建后端实例
    /// @param type 后端类型
    /// @return 后端实例, 失败返回nullptr
    static std::unique_ptr<INiqqudBackend> create(BackendType type);

    /// @brief 检查后端类型是否可用
    static bool isAvailable(BackendType type);

    /// @brief 获取所有可用的后端类型
    static std::vector<BackendType> getAvailableBackends();

    /// @brief 获取后端名称
    static const char* getBackendName(BackendType type) {
        return backendTypeToString(type);
    }
};

}  // namespace niqqud

#endif  // NIQQUD_BACKEND_HPP
