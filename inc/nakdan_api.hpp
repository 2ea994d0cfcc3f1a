#ifndef NAKDAN_API_HPP
#define NAKDAN_API_HPP

/**
 * NakdanSDK - Hebrew niqqud restoration engine
 *
 * 为无注音的希伯来语文本自动添加注音符号 (niqqud), 提供统一的 C++ 接口。
 *
 * 使用示例 1 - 单次调用（阻塞模式）:
 *
 *   auto engine = std::make_shared<Nakdan::NakdanEngine>();
 *   auto result = engine->Call("שלום עולם");
 *   if (result && result->IsSuccess()) {
 *       std::cout << result->GetText() << std::endl;
 *   }
 *
 * 使用示例 2 - 带配置的初始化:
 *
 *   Nakdan::NakdanConfig config = Nakdan::NakdanConfig::Nakdimon("/opt/models/nakdimon.onnx");
 *   config.debounce_ms = 200;
 *   auto engine = std::make_shared<Nakdan::NakdanEngine>(config);
 *
 * 使用示例 3 - 随输入实时生成（防抖）:
 *
 *   engine->SetCallback(callback);
 *   engine->Generate("ש");
 *   engine->Generate("של");
 *   engine->Generate("שלום");   // 只有最后一次输入会产生结果
 */

#include <cstdint>

#include <memory>
#include <string>

// Forward declaration of internal types
namespace niqqud {
    class ModelGateway;
}  // namespace niqqud

namespace Nakdan {

// =============================================================================
// BackendType - 后端类型
// =============================================================================

enum class BackendType {
    NAKDIMON,           ///< Nakdimon 字符模型 (ONNX)
    CUSTOM,             ///< 自定义后端 (通过 ModelGateway 注入)
};

// =============================================================================
// GenerationState - 生成状态
// =============================================================================

enum class GenerationState {
    IDLE,               ///< 无请求
    DEBOUNCING,         ///< 等待输入静默
    RUNNING,            ///< 推理中
    COMPLETED,          ///< 最近一次请求成功
    FAILED,             ///< 最近一次请求失败
};

// =============================================================================
// NakdanConfig - 引擎配置
// =============================================================================

struct NakdanConfig {
    // -------------------------------------------------------------------------
    // 后端选择
    // -------------------------------------------------------------------------

    BackendType backend = BackendType::NAKDIMON;  ///< 后端类型

    // -------------------------------------------------------------------------
    // 模型配置
    // -------------------------------------------------------------------------

    std::string model_path = "~/.cache/nakdimon/nakdimon.onnx";  ///< ONNX 模型路径
    int64_t max_length = 10000;         ///< 模型输入长度 (动态长度模型使用)

    // -------------------------------------------------------------------------
    // 生成参数
    // -------------------------------------------------------------------------

    int debounce_ms = 300;              ///< Generate() 防抖间隔 (毫秒)
    bool fold_final_forms = false;      ///< 词尾字母折叠为普通字母

    // -------------------------------------------------------------------------
    // 性能配置
    // -------------------------------------------------------------------------

    int num_threads = 2;                ///< 推理线程数
    bool enable_warmup = true;          ///< 加载后预热

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置
    static NakdanConfig Default() {
        return NakdanConfig();
    }

    /// @brief 创建 Nakdimon 配置
    /// @param model_path ONNX 模型路径
    static NakdanConfig Nakdimon(const std::string& model_path = "~/.cache/nakdimon/nakdimon.onnx") {
        NakdanConfig config;
        config.backend = BackendType::NAKDIMON;
        config.model_path = model_path;
        return config;
    }

    // 链式配置
    NakdanConfig withModelPath(const std::string& path) const {
        auto c = *this;
        c.model_path = path;
        return c;
    }

    NakdanConfig withMaxLength(int64_t length) const {
        auto c = *this;
        c.max_length = length;
        return c;
    }

    NakdanConfig withDebounce(int ms) const {
        auto c = *this;
        c.debounce_ms = ms;
        return c;
    }

    NakdanConfig withThreads(int threads) const {
        auto c = *this;
        c.num_threads = threads;
        return c;
    }
};

// =============================================================================
// NakdanResult - 生成结果
// =============================================================================

class NakdanResult {
public:
    NakdanResult();
    ~NakdanResult();

    // 禁止拷贝，允许移动
    NakdanResult(const NakdanResult&) = delete;
    NakdanResult& operator=(const NakdanResult&) = delete;
    NakdanResult(NakdanResult&&) noexcept;
    NakdanResult& operator=(NakdanResult&&) noexcept;

    /// @brief 获取加注音后的文本 (UTF-8)
    std::string GetText() const;

    /// @brief 获取请求 ID (Call() 的结果为 0)
    uint64_t GetRequestId() const;

    // -------------------------------------------------------------------------
    // 状态检查
    // -------------------------------------------------------------------------

    /// @brief 是否成功
    bool IsSuccess() const;

    /// @brief 获取错误码 ("OK", "PREDICTION_FAILED", ...)
    std::string GetCode() const;

    /// @brief 获取错误信息
    std::string GetMessage() const;

    /// @brief 是否为空结果
    bool IsEmpty() const;

    /// @brief 获取处理时间 (毫秒)
    int GetProcessingTimeMs() const;

private:
    friend class NakdanEngine;
    friend class CallbackAdapter;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// NakdanCallback - 回调接口
// =============================================================================

/**
 * @brief Generate() 的结果通知
 *
 * - 只有最新一次 Generate() 的结果会被通知, 被取代或取消的请求不会触发回调
 * - 回调在引擎内部线程中调用, 不要在回调中同步调用 Generate()/Cancel()
 */
class NakdanCallback {
public:
    virtual ~NakdanCallback() = default;

    /// @brief 生成成功
    virtual void OnResult(std::shared_ptr<NakdanResult> result) {}

    /// @brief 生成失败
    virtual void OnError(std::shared_ptr<NakdanResult> result) {}
};

// =============================================================================
// NakdanEngine - 注音引擎
// =============================================================================

class NakdanEngine {
public:
    // =========================================================================
    // 构造函数
    // =========================================================================

    /// @brief 构造引擎 (模型在首次使用时加载)
    /// @param config 配置对象
    explicit NakdanEngine(const NakdanConfig& config = NakdanConfig());

    /// @brief 使用已构造的模型网关 (自定义后端)
    NakdanEngine(const NakdanConfig& config, std::shared_ptr<niqqud::ModelGateway> gateway);

    virtual ~NakdanEngine();

    // 禁止拷贝
    NakdanEngine(const NakdanEngine&) = delete;
    NakdanEngine& operator=(const NakdanEngine&) = delete;

    // =========================================================================
    // 单次调用（阻塞）
    // =========================================================================

    /// @brief 去除已有注音后重新加注音 (阻塞直到完成)
    /// @param text UTF-8 文本
    /// @return 结果对象, 不会返回 nullptr
    std::shared_ptr<NakdanResult> Call(const std::string& text);

    // =========================================================================
    // 实时生成（防抖 + 可取消）
    // =========================================================================

    /// @brief 提交新输入, 取代所有未完成的请求
    /// @return 请求 ID
    uint64_t Generate(const std::string& text);

    /// @brief 取消未完成的请求
    void Cancel();

    /// @brief 最近一次成功的输出
    std::string GetOutput() const;

    /// @brief 是否正在推理
    bool IsGenerating() const;

    /// @brief 最近一次请求是否失败
    bool HasError() const;

    /// @brief 最近一次失败的错误信息 (无错误时为空)
    std::string GetErrorMessage() const;

    /// @brief 当前状态
    GenerationState GetState() const;

    /// @brief 等待所有请求完成
    /// @param timeout_ms 超时 (毫秒)
    /// @return 超时返回 false
    bool WaitForIdle(int timeout_ms) const;

    /// @brief 设置回调 (nullptr 取消)
    void SetCallback(std::shared_ptr<NakdanCallback> callback);

    // =========================================================================
    // 辅助方法
    // =========================================================================

    /// @brief 去除所有注音符号 (U+0591 - U+05C7)
    static std::string StripNiqqud(const std::string& text);

    /// @brief 立即加载模型
    /// @return 是否成功
    bool LoadModel();

    /// @brief 模型是否已加载
    bool IsModelLoaded() const;

    /// @brief 获取引擎名称
    std::string GetEngineName() const;

    /// @brief 获取当前配置
    NakdanConfig GetConfig() const;

private:
    friend class CallbackAdapter;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace Nakdan

#endif  // NAKDAN_API_HPP
