#include "internal/generation_controller.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "internal/text/text_utils.hpp"

namespace niqqud {

// =============================================================================
// Construction / Destruction
// =============================================================================

GenerationController::GenerationController(std::shared_ptr<ModelGateway> gateway,
                                           const NiqqudConfig& config)
    : gateway_(std::move(gateway)),
      pipeline_(gateway_, config.fold_final_forms),
      debounce_(config.debounce_ms) {
    worker_ = std::thread(&GenerationController::workerLoop, this);
}

GenerationController::~GenerationController() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        has_pending_ = false;
        current_token_.cancel();
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

// =============================================================================
// 请求控制
// =============================================================================

uint64_t GenerationController::generate(const std::string& input) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    std::unique_lock<std::mutex> lock(mutex_);

    current_token_.cancel();
    current_token_ = CancellationToken();
    uint64_t request_id = ++latest_request_id_;

    if (input.empty()) {
        has_pending_ = false;
        state_ = GenerationState::COMPLETED;
        output_.clear();
        error_.reset();

        GenerationResult result;
        result.request_id = request_id;
        result.success = true;
        IGenerationCallback* callback = callback_;
        lock.unlock();

        wake_cv_.notify_all();
        idle_cv_.notify_all();
        if (callback) {
            callback->onResult(result);
        }
        return request_id;
    }

    pending_text_ = text::removeNiqqud(input);
    pending_request_id_ = request_id;
    has_pending_ = true;
    deadline_ = std::chrono::steady_clock::now() + debounce_;
    state_ = GenerationState::DEBOUNCING;
    lock.unlock();

    wake_cv_.notify_all();
    return request_id;
}

void GenerationController::cancel() {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_token_.cancel();
        has_pending_ = false;
        state_ = GenerationState::IDLE;
    }
    wake_cv_.notify_all();
    idle_cv_.notify_all();
}

void GenerationController::setCallback(IGenerationCallback* callback) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = callback;
}

// =============================================================================
// 状态查询
// =============================================================================

std::string GenerationController::getOutput() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return output_;
}

bool GenerationController::isGenerating() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == GenerationState::RUNNING;
}

std::optional<ErrorInfo> GenerationController::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

GenerationState GenerationController::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t GenerationController::getLatestRequestId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_request_id_;
}

bool GenerationController::waitForIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return !isBusyLocked(); });
}

bool GenerationController::isBusyLocked() const {
    return state_ == GenerationState::DEBOUNCING || state_ == GenerationState::RUNNING;
}

// =============================================================================
// 后台线程
// =============================================================================

void GenerationController::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        wake_cv_.wait(lock, [this]() { return stop_ || has_pending_; });
        if (stop_) {
            break;
        }

        // 防抖: 截止时间可能被新的 generate() 推后, 醒来后重新检查
        if (std::chrono::steady_clock::now() < deadline_) {
            wake_cv_.wait_until(lock, deadline_);
            continue;
        }

        std::string request_text = pending_text_;
        uint64_t request_id = pending_request_id_;
        CancellationToken token = current_token_;
        has_pending_ = false;
        state_ = GenerationState::RUNNING;
        error_.reset();
        lock.unlock();

        auto start = std::chrono::steady_clock::now();
        std::string output;
        ErrorInfo error = ErrorInfo::ok();
        try {
            error = pipeline_.run(request_text, token, output);
        } catch (const std::exception& e) {
            output.clear();
            error = ErrorInfo::error(ErrorCode::INTERNAL_ERROR,
                std::string("Pipeline threw: ") + e.what());
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        deliver(request_id, token, error, output, elapsed.count());

        lock.lock();
    }
}

void GenerationController::deliver(uint64_t request_id, const CancellationToken& token,
                                   const ErrorInfo& error, const std::string& output,
                                   int64_t processing_time_ms) {
    std::lock_guard<std::mutex> delivery(delivery_mutex_);

    GenerationResult result;
    IGenerationCallback* callback = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // 已被新请求取代或已取消: 丢弃, 状态由 generate()/cancel() 维护
        if (request_id != latest_request_id_ || token.isCancelled() ||
            error.code == ErrorCode::CANCELLED) {
            return;
        }

        result.request_id = request_id;
        result.processing_time_ms = processing_time_ms;
        if (error.isOk()) {
            state_ = GenerationState::COMPLETED;
            output_ = output;
            error_.reset();
            result.text = output;
            result.success = true;
        } else {
            state_ = GenerationState::FAILED;
            error_ = error;
            result.success = false;
            result.error = error;
            std::cerr << "[Nakdan] Generation " << request_id << " "
                      << generationStateToString(state_) << ": "
                      << errorCodeToString(error.code) << ": " << error.message << std::endl;
        }
        callback = callback_;
    }
    idle_cv_.notify_all();

    if (!callback) {
        return;
    }
    try {
        if (result.success) {
            callback->onResult(result);
        } else {
            callback->onError(result);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Nakdan] Callback threw: " << e.what() << std::endl;
    }
}

}  // namespace niqqud
