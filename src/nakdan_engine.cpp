#include "nakdan_api.hpp"

#include <cstdint>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "internal/generation_controller.hpp"
#include "internal/model_gateway.hpp"
#include "internal/niqqud_config.hpp"
#include "internal/niqqud_types.hpp"
#include "internal/text/text_utils.hpp"
#include "internal/vocalizer_pipeline.hpp"

namespace Nakdan {

// =============================================================================
// NakdanResult 实现
// =============================================================================

struct NakdanResult::Impl {
    std::string text;
    uint64_t request_id = 0;
    bool success = false;
    std::string code = "OK";
    std::string message;
    int processing_time_ms = 0;
};

NakdanResult::NakdanResult() : impl_(std::make_unique<Impl>()) {}
NakdanResult::~NakdanResult() = default;

NakdanResult::NakdanResult(NakdanResult&&) noexcept = default;
NakdanResult& NakdanResult::operator=(NakdanResult&&) noexcept = default;

std::string NakdanResult::GetText() const {
    return impl_->text;
}

uint64_t NakdanResult::GetRequestId() const {
    return impl_->request_id;
}

bool NakdanResult::IsSuccess() const {
    return impl_->success;
}

std::string NakdanResult::GetCode() const {
    return impl_->code;
}

std::string NakdanResult::GetMessage() const {
    return impl_->message;
}

bool NakdanResult::IsEmpty() const {
    return impl_->text.empty();
}

int NakdanResult::GetProcessingTimeMs() const {
    return impl_->processing_time_ms;
}

// =============================================================================
// CallbackAdapter - 内部回调 → 公共回调
// =============================================================================

class CallbackAdapter : public niqqud::IGenerationCallback {
public:
    explicit CallbackAdapter(std::shared_ptr<NakdanCallback> callback)
        : callback_(std::move(callback)) {}

    void onResult(const niqqud::GenerationResult& result) override {
        callback_->OnResult(convert(result));
    }

    void onError(const niqqud::GenerationResult& result) override {
        callback_->OnError(convert(result));
    }

    static std::shared_ptr<NakdanResult> convert(const niqqud::GenerationResult& result) {
        auto out = std::make_shared<NakdanResult>();
        out->impl_->text = result.text;
        out->impl_->request_id = result.request_id;
        out->impl_->success = result.success;
        out->impl_->code = niqqud::errorCodeToString(result.error.code);
        out->impl_->message = result.error.message;
        out->impl_->processing_time_ms = static_cast<int>(result.processing_time_ms);
        return out;
    }

private:
    std::shared_ptr<NakdanCallback> callback_;
};

// =============================================================================
// NakdanEngine 实现
// =============================================================================

// 转换 Nakdan::BackendType 到 niqqud::BackendType
static niqqud::BackendType convertBackendType(BackendType type) {
    switch (type) {
        case BackendType::NAKDIMON:
            return niqqud::BackendType::NAKDIMON;
        case BackendType::CUSTOM:
            return niqqud::BackendType::CUSTOM;
        default:
            return niqqud::BackendType::NAKDIMON;
    }
}

static GenerationState convertState(niqqud::GenerationState state) {
    switch (state) {
        case niqqud::GenerationState::DEBOUNCING: return GenerationState::DEBOUNCING;
        case niqqud::GenerationState::RUNNING:    return GenerationState::RUNNING;
        case niqqud::GenerationState::COMPLETED:  return GenerationState::COMPLETED;
        case niqqud::GenerationState::FAILED:     return GenerationState::FAILED;
        case niqqud::GenerationState::IDLE:
        default:                                  return GenerationState::IDLE;
    }
}

static niqqud::NiqqudConfig convertConfig(const NakdanConfig& cfg) {
    auto internal_config = niqqud::NiqqudConfig()
        .withModelPath(cfg.model_path)
        .withMaxLength(cfg.max_length)
        .withDebounce(cfg.debounce_ms)
        .withFinalFormFolding(cfg.fold_final_forms)
        .withWarmup(cfg.enable_warmup);
    internal_config.backend = convertBackendType(cfg.backend);
    internal_config.num_threads = cfg.num_threads;
    return internal_config;
}

struct NakdanEngine::Impl {
    NakdanConfig config;
    niqqud::ErrorInfo config_error = niqqud::ErrorInfo::ok();

    std::shared_ptr<niqqud::ModelGateway> gateway;
    std::unique_ptr<niqqud::VocalizerPipeline> pipeline;

    // controller 先于 adapter 析构, 后台线程不会访问已释放的回调
    std::unique_ptr<CallbackAdapter> adapter;
    std::unique_ptr<niqqud::GenerationController> controller;

    void init(const NakdanConfig& cfg, std::shared_ptr<niqqud::ModelGateway> injected) {
        config = cfg;

        auto internal_config = convertConfig(cfg);
        config_error = internal_config.validate();
        if (!config_error.isOk()) {
            std::cerr << "[Nakdan] Invalid config: " << config_error.message << std::endl;
        }

        gateway = injected ? std::move(injected)
                           : std::make_shared<niqqud::ModelGateway>(internal_config);
        pipeline = std::make_unique<niqqud::VocalizerPipeline>(gateway, internal_config.fold_final_forms);
        controller = std::make_unique<niqqud::GenerationController>(gateway, internal_config);
    }
};

NakdanEngine::NakdanEngine(const NakdanConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config, nullptr);
}

NakdanEngine::NakdanEngine(const NakdanConfig& config,
                           std::shared_ptr<niqqud::ModelGateway> gateway)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config, std::move(gateway));
}

NakdanEngine::~NakdanEngine() = default;

std::shared_ptr<NakdanResult> NakdanEngine::Call(const std::string& text) {
    auto result = std::make_shared<NakdanResult>();

    if (!impl_->config_error.isOk()) {
        result->impl_->success = false;
        result->impl_->code = niqqud::errorCodeToString(impl_->config_error.code);
        result->impl_->message = impl_->config_error.message;
        return result;
    }

    std::string clean = niqqud::text::removeNiqqud(text);
    if (clean.empty()) {
        result->impl_->success = true;
        return result;
    }

    auto start_time = std::chrono::high_resolution_clock::now();

    std::string output;
    auto error = impl_->pipeline->run(clean, niqqud::CancellationToken(), output);

    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    result->impl_->processing_time_ms = static_cast<int>(duration.count());

    if (!error.isOk()) {
        result->impl_->success = false;
        result->impl_->code = niqqud::errorCodeToString(error.code);
        result->impl_->message = error.message;
        return result;
    }

    result->impl_->text = std::move(output);
    result->impl_->success = true;
    return result;
}

uint64_t NakdanEngine::Generate(const std::string& text) {
    return impl_->controller->generate(text);
}

void NakdanEngine::Cancel() {
    impl_->controller->cancel();
}

std::string NakdanEngine::GetOutput() const {
    return impl_->controller->getOutput();
}

bool NakdanEngine::IsGenerating() const {
    return impl_->controller->isGenerating();
}

bool NakdanEngine::HasError() const {
    return impl_->controller->getError().has_value();
}

std::string NakdanEngine::GetErrorMessage() const {
    auto error = impl_->controller->getError();
    return error ? error->message : "";
}

GenerationState NakdanEngine::GetState() const {
    return convertState(impl_->controller->getState());
}

bool NakdanEngine::WaitForIdle(int timeout_ms) const {
    return impl_->controller->waitForIdle(std::chrono::milliseconds(timeout_ms));
}

void NakdanEngine::SetCallback(std::shared_ptr<NakdanCallback> callback) {
    std::unique_ptr<CallbackAdapter> adapter;
    if (callback) {
        adapter = std::make_unique<CallbackAdapter>(std::move(callback));
    }
    impl_->controller->setCallback(adapter.get());
    // setCallback() 返回后旧回调不会再被调用
    impl_->adapter = std::move(adapter);
}

std::string NakdanEngine::StripNiqqud(const std::string& text) {
    return niqqud::text::removeNiqqud(text);
}

bool NakdanEngine::LoadModel() {
    auto error = impl_->gateway->acquire();
    return error.isOk();
}

bool NakdanEngine::IsModelLoaded() const {
    return impl_->gateway->isLoaded();
}

std::string NakdanEngine::GetEngineName() const {
    auto name = impl_->gateway->backendName();
    if (!name.empty()) {
        return name;
    }
    return std::string("Nakdan (") + niqqud::backendTypeToString(convertBackendType(impl_->config.backend)) + ")";
}

NakdanConfig NakdanEngine::GetConfig() const {
    return impl_->config;
}

}  // namespace Nakdan
