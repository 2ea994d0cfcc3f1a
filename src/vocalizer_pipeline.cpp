#include "internal/vocalizer_pipeline.hpp"

#include <cstdint>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace niqqud {

VocalizerPipeline::VocalizerPipeline(std::shared_ptr<ModelGateway> gateway, bool fold_final_forms)
    : gateway_(std::move(gateway)),
      codec_(fold_final_forms),
      segmenter_(codec_),
      decoder_(codec_) {
}

ErrorInfo VocalizerPipeline::run(const std::string& clean_text,
                                 const CancellationToken& token,
                                 std::string& output) const {
    // 末尾补一个空格, 保证最后一个词也以边界结束
    std::u32string input = text::decodeUtf8(clean_text + " ");

    auto max_length = gateway_->maxLength();
    auto chunks = segmenter_.split(input, static_cast<size_t>(max_length));

    std::vector<std::u32string> outputs;
    outputs.reserve(chunks.size());

    for (const auto& chunk : chunks) {
        if (token.isCancelled()) {
            return ErrorInfo::error(ErrorCode::CANCELLED, "Generation cancelled");
        }

        std::vector<int64_t> indices = codec_.encodeText(chunk);

        ChannelPredictions predictions;
        auto err = gateway_->predict(indices, predictions);
        if (!err.isOk()) {
            return err;
        }

        outputs.push_back(decoder_.merge(chunk, indices, predictions, chunk.size()));
    }

    if (token.isCancelled()) {
        return ErrorInfo::error(ErrorCode::CANCELLED, "Generation cancelled");
    }

    output = text::encodeUtf8(text::trimSpaces(Decoder::joinChunks(outputs)));
    return ErrorInfo::ok();
}

}  // namespace niqqud
