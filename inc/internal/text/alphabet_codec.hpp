#ifndef NIQQUD_ALPHABET_CODEC_HPP
#define NIQQUD_ALPHABET_CODEC_HPP

/**
 * AlphabetCodec - 模型字符表
 *
 * Nakdimon 模型的输入字符表 (43 个符号) 与三个输出通道
 * (niqqud / dagesh / sin) 的类别表, 以及可接受各类符号的字母集合。
 *
 * 输入字符表布局:
 *   0       MASK (填充)
 *   1-3     占位符: 'H' 合字, 'O' 未知字符, '5' 数字
 *   4-15    规范化后的标点: 空格 ! " ' ( ) , - . : ; ?
 *   16-42   希伯来字母 U+05D0 - U+05EA (含词尾形式)
 */

#include <cstdint>

#include <string>
#include <unordered_map>
#include <vector>

namespace niqqud {
namespace text {

class AlphabetCodec {
public:
    // -------------------------------------------------------------------------
    // 输入字符表常量
    // -------------------------------------------------------------------------

    static constexpr int64_t MASK_INDEX = 0;
    static constexpr int64_t LIGATURE_INDEX = 1;
    static constexpr int64_t UNKNOWN_INDEX = 2;
    static constexpr int64_t DIGIT_INDEX = 3;
    static constexpr int64_t FIRST_LETTER_INDEX = 16;

    static constexpr char32_t MASK_SYMBOL = U'\0';
    static constexpr char32_t LIGATURE_SYMBOL = U'H';
    static constexpr char32_t UNKNOWN_SYMBOL = U'O';
    static constexpr char32_t DIGIT_SYMBOL = U'5';

    // -------------------------------------------------------------------------
    // 输出通道常量
    // -------------------------------------------------------------------------

    static constexpr int NIQQUD_CLASSES = 16;
    static constexpr int DAGESH_CLASSES = 3;
    static constexpr int SIN_CLASSES = 4;

    /// Classes below this index (MASK, RAFE) never emit a mark.
    static constexpr int FIRST_MARK_CLASS = 2;

    static constexpr char32_t RAFE = 0x05BF;

    /// @param fold_final_forms 是否将词尾字母折叠为普通形式
    explicit AlphabetCodec(bool fold_final_forms = false);

    // -------------------------------------------------------------------------
    // 规范化与编解码
    // -------------------------------------------------------------------------

    /**
     * @brief 将任意字符映射到字符表中的符号
     * @param ch 输入码点
     * @return 字符表中的符号, 无法识别时返回 UNKNOWN_SYMBOL
     * @note 全函数, 不会失败
     */
    char32_t normalize(char32_t ch) const;

    /// @brief 符号 → 索引, 不在表中的符号返回 UNKNOWN_INDEX
    int64_t encode(char32_t symbol) const;

    /// @brief 索引 → 符号, 越界索引返回 UNKNOWN_SYMBOL
    char32_t decode(int64_t index) const;

    /// @brief normalize + encode 整段文本
    std::vector<int64_t> encodeText(const std::u32string& text) const;

    /// @brief 字符表大小 (43)
    static size_t vocabularySize();

    bool foldsFinalForms() const { return fold_final_forms_; }

    // -------------------------------------------------------------------------
    // 字母资格
    // -------------------------------------------------------------------------

    static bool canTakeDagesh(char32_t letter);
    static bool canTakeSinDot(char32_t letter);
    static bool canTakeNiqqud(char32_t letter);

    // -------------------------------------------------------------------------
    // 输出通道类别 → 符号 (0 表示不输出)
    // -------------------------------------------------------------------------

    static char32_t niqqudMark(int cls);
    static char32_t dageshMark(int cls);
    static char32_t sinMark(int cls);

    /// @brief 词尾字母对应的普通字母, 非词尾字母原样返回
    static char32_t foldFinalForm(char32_t letter);

    /// @brief 是否为 Unicode 十进制数字 (General Category Nd)
    static bool isDecimalDigit(char32_t ch);

private:
    bool fold_final_forms_;
    std::unordered_map<char32_t, int64_t> symbol_to_index_;
};

}  // namespace text
}  // namespace niqqud

#endif  // NIQQUD_ALPHABET_CODEC_HPP
