#ifndef NIQQUD_GENERATION_CONTROLLER_HPP
#define NIQQUD_GENERATION_CONTROLLER_HPP

#include <cstdint>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/model_gateway.hpp"
#include "internal/niqqud_config.hpp"
#include "internal/niqqud_types.hpp"
#include "internal/vocalizer_pipeline.hpp"

namespace niqqud {

// =============================================================================
// GenerationController - 防抖 + 可取消的后台生成
// =============================================================================
//
// 状态机:
//
//   IDLE ──generate()──► DEBOUNCING ──静默 debounce_ms──► RUNNING
//                            ▲                               │
//                            └────────generate()─────────────┤
//                                                            ▼
//                                                 COMPLETED / FAILED
//
//   任意状态 ──cancel()──► IDLE
//
// 每个控制器一个后台线程, 同一时刻最多一个 RUNNING 请求。
// 只有 request_id 仍为最新且未被取消的结果才会发布;
// generate()/cancel() 与发布过程互斥, 因此新请求发出后不会再看到旧结果。
//
// 回调在后台线程中调用, 回调内不得同步调用 generate()/cancel()。
//

class GenerationController {
public:
    GenerationController(std::shared_ptr<ModelGateway> gateway, const NiqqudConfig& config);
    ~GenerationController();

    GenerationController(const GenerationController&) = delete;
    GenerationController& operator=(const GenerationController&) = delete;

    // -------------------------------------------------------------------------
    // 请求控制
    // -------------------------------------------------------------------------

    /**
     * @brief 提交新文本, 取代所有未完成的请求
     * @param text 用户输入 (可含注音符号, 处理前会去除)
     * @return 请求ID
     */
    uint64_t generate(const std::string& text);

    /// @brief 丢弃未完成的请求, 不发布任何结果
    void cancel();

    // -------------------------------------------------------------------------
    // 状态查询
    // -------------------------------------------------------------------------

    std::string getOutput() const;
    bool isGenerating() const;
    std::optional<ErrorInfo> getError() const;
    GenerationState getState() const;
    uint64_t getLatestRequestId() const;

    /**
     * @brief 等待直到没有 DEBOUNCING / RUNNING 的请求
     * @return 超时返回 false
     */
    bool waitForIdle(std::chrono::milliseconds timeout) const;

    /// @brief 设置回调 (不转移所有权, nullptr 取消)
    void setCallback(IGenerationCallback* callback);

private:
    void workerLoop();
    void deliver(uint64_t request_id, const CancellationToken& token,
                 const ErrorInfo& error, const std::string& output,
                 int64_t processing_time_ms);
    bool isBusyLocked() const;

    std::shared_ptr<ModelGateway> gateway_;
    VocalizerPipeline pipeline_;
    std::chrono::milliseconds debounce_;

    // 发布锁: 先于 mutex_ 获取
    std::mutex delivery_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable wake_cv_;
    mutable std::condition_variable idle_cv_;

    // 可观察状态
    GenerationState state_ = GenerationState::IDLE;
    std::string output_;
    std::optional<ErrorInfo> error_;
    uint64_t latest_request_id_ = 0;

    // 待处理请求
    bool has_pending_ = false;
    std::string pending_text_;
    uint64_t pending_request_id_ = 0;
    std::chrono::steady_clock::time_point deadline_;
    CancellationToken current_token_;

    IGenerationCallback* callback_ = nullptr;
    bool stop_ = false;
    std::thread worker_;
};

}  // namespace niqqud

#endif  // NIQQUD_GENERATION_CONTROLLER_HPP
