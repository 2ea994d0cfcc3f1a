#ifndef NIQQUD_VOCALIZER_PIPELINE_HPP
#define NIQQUD_VOCALIZER_PIPELINE_HPP

#include <atomic>
#include <memory>
#include <string>

#include "internal/decoder.hpp"
#include "internal/model_gateway.hpp"
#include "internal/niqqud_types.hpp"
#include "internal/text/alphabet_codec.hpp"
#include "internal/text/segmenter.hpp"

namespace niqqud {

// =============================================================================
// CancellationToken - 协作式取消标志
// =============================================================================

class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool isCancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// =============================================================================
// VocalizerPipeline - 分段 → 编码 → 推理 → 合并 → 拼接
// =============================================================================
//
// 输入为已去除注音符号的 UTF-8 文本。每个片段推理前检查取消标志,
// 被取消时返回 CANCELLED 且不产生部分结果。
//

class VocalizerPipeline {
public:
    VocalizerPipeline(std::shared_ptr<ModelGateway> gateway, bool fold_final_forms);

    VocalizerPipeline(const VocalizerPipeline&) = delete;
    VocalizerPipeline& operator=(const VocalizerPipeline&) = delete;

    /**
     * @brief 为文本加注音符号
     * @param clean_text 不含注音符号的文本
     * @param token 取消标志
     * @param output [out] 成功时为去除首尾空白后的结果
     */
    ErrorInfo run(const std::string& clean_text,
                  const CancellationToken& token,
                  std::string& output) const;

    const text::AlphabetCodec& codec() const { return codec_; }

private:
    std::shared_ptr<ModelGateway> gateway_;
    text::AlphabetCodec codec_;
    text::Segmenter segmenter_;
    Decoder decoder_;
};

}  // namespace niqqud

#endif  // NIQQUD_VOCALIZER_PIPELINE_HPP
