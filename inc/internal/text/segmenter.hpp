#ifndef NIQQUD_SEGMENTER_HPP
#define NIQQUD_SEGMENTER_HPP

#include <string>
#include <vector>

#include "internal/text/alphabet_codec.hpp"

namespace niqqud {
namespace text {

// =============================================================================
// Segmenter - 按词边界分段
// =============================================================================
//
// 模型只接受有限长度的输入。Segmenter 将文本切成长度 < max_length 的片段,
// 切点落在最近的词边界 (规范化为空格的字符) 之后, 边界字符留在前一片段末尾。
// 只有单个词超过窗口时才在 max_length - 1 处截断。
//
// 所有片段首尾相接即为原文。
//

class Segmenter {
public:
    explicit Segmenter(const AlphabetCodec& codec);

    /**
     * @brief 分段
     * @param text 码点序列
     * @param max_length 模型输入长度; <= 1 时整段返回
     * @return 片段列表 (空文本返回空列表)
     */
    std::vector<std::u32string> split(const std::u32string& text, size_t max_length) const;

    /// @brief 字符是否为词边界
    bool isBoundary(char32_t ch) const;

private:
    const AlphabetCodec& codec_;
};

}  // namespace text
}  // namespace niqqud

#endif  // NIQQUD_SEGMENTER_HPP
