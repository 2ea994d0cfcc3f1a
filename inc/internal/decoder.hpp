#ifndef NIQQUD_DECODER_HPP
#define NIQQUD_DECODER_HPP

#include <cstdint>

#include <string>
#include <vector>

#include "internal/niqqud_types.hpp"
#include "internal/text/alphabet_codec.hpp"

namespace niqqud {

// =============================================================================
// Decoder - 模型输出 → 加注音文本
// =============================================================================
//
// 每个位置独立对三个通道做 argmax, 再按字母资格过滤。
// 同一字母上的符号顺序固定为 dagesh → shin/sin 点 → 元音,
// 与 Unicode 希伯来组合符号的堆叠顺序一致。
//

class Decoder {
public:
    explicit Decoder(const text::AlphabetCodec& codec);

    /**
     * @brief argmax over one row
     * @return 最大分数的类别索引, 并列时取最小索引
     */
    static int argmax(const ScoreMatrix& scores, int64_t row);

    /**
     * @brief 将预测合并回原始字母
     * @param letters 原始 (未规范化) 字符
     * @param normalized_indices 编码后的索引 (遇到 MASK 即停止)
     * @param predictions 三通道分数 (行数可大于 seq_len, 多出部分为填充)
     * @param seq_len 有效长度
     * @return 加注音后的片段
     */
    std::u32string merge(const std::u32string& letters,
                         const std::vector<int64_t>& normalized_indices,
                         const ChannelPredictions& predictions,
                         size_t seq_len) const;

    /**
     * @brief 拼接各片段输出
     *
     * 按空格切分的片段末尾已带有边界空格, 中间截断的片段直接相接;
     * 拼接后连续空格折叠为一个。
     */
    static std::u32string joinChunks(const std::vector<std::u32string>& outputs);

private:
    const text::AlphabetCodec& codec_;
};

}  // namespace niqqud

#endif  // NIQQUD_DECODER_HPP
