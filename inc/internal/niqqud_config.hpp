#ifndef NIQQUD_CONFIG_HPP
#define NIQQUD_CONFIG_HPP

#include <cstdint>
#include <cstdlib>

#include <string>

#include "internal/niqqud_types.hpp"

namespace niqqud {

// =============================================================================
// Niqqud Config (内部配置)
// =============================================================================

struct NiqqudConfig {
    // -------------------------------------------------------------------------
    // 后端选择
    // -------------------------------------------------------------------------

    BackendType backend = BackendType::NAKDIMON;  ///< 后端类型

    // -------------------------------------------------------------------------
    // 模型配置
    // -------------------------------------------------------------------------

    std::string model_path = "~/.cache/nakdimon/nakdimon.onnx";  ///< ONNX 模型路径
    int64_t max_length = 10000;         ///< 模型输入长度 (模型声明固定长度时以模型为准)

    // -------------------------------------------------------------------------
    // 交互参数
    // -------------------------------------------------------------------------

    int debounce_ms = 300;              ///< generate() 静默间隔 (毫秒)

    // -------------------------------------------------------------------------
    // 文本规范化
    // -------------------------------------------------------------------------

    bool fold_final_forms = false;      ///< 词尾字母折叠为普通字母 (ך→כ ...)

    // -------------------------------------------------------------------------
    // 性能配置
    // -------------------------------------------------------------------------

    int num_threads = 2;                ///< 推理线程数
    bool enable_warmup = true;          ///< 加载后预热

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    static NiqqudConfig Default() {
        return NiqqudConfig();
    }

    /// @brief 创建 Nakdimon 配置
    /// @param model_path ONNX 模型路径
    static NiqqudConfig Nakdimon(const std::string& model_path = "~/.cache/nakdimon/nakdimon.onnx") {
        NiqqudConfig config;
        config.backend = BackendType::NAKDIMON;
        config.model_path = model_path;
        return config;
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    NiqqudConfig withModelPath(const std::string& path) const {
        auto c = *this;
        c.model_path = path;
        return c;
    }

    NiqqudConfig withMaxLength(int64_t length) const {
        auto c = *this;
        c.max_length = length;
        return c;
    }

    NiqqudConfig withDebounce(int ms) const {
        auto c = *this;
        c.debounce_ms = ms;
        return c;
    }

    NiqqudConfig withFinalFormFolding(bool fold) const {
        auto c = *this;
        c.fold_final_forms = fold;
        return c;
    }

    NiqqudConfig withWarmup(bool warmup) const {
        auto c = *this;
        c.enable_warmup = warmup;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 获取模型文件的完整路径
    /// @return 展开 ~ 后的路径
    std::string getExpandedModelPath() const {
        if (!model_path.empty() && model_path[0] == '~') {
            const char* home = getenv("HOME");
            if (home) {
                return std::string(home) + model_path.substr(1);
            }
        }
        return model_path;
    }

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (model_path.empty() && backend == BackendType::NAKDIMON) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Model path is empty");
        }
        if (max_length < 2) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "max_length must be at least 2");
        }
        if (debounce_ms < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "debounce_ms must be non-negative");
        }
        if (num_threads < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "num_threads must be non-negative");
        }
        return ErrorInfo::ok();
    }
};

}  // namespace niqqud

#endif  // NIQQUD_CONFIG_HPP
