#ifndef NIQQUD_TEXT_UTILS_HPP
#define NIQQUD_TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * UTF-8 与码点之间的转换、希伯来语注音符号 (niqqud) 的识别与去除、
 * 空白处理等。
 */

#include <string>

namespace niqqud {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 将 UTF-8 字符串解码为码点序列
 * @param str UTF-8 编码的字符串
 * @return 码点序列 (非法字节序列替换为 U+FFFD)
 */
std::u32string decodeUtf8(const std::string& str);

/**
 * @brief 将码点序列编码为 UTF-8
 * @param str 码点序列
 * @return UTF-8 字符串
 */
std::string encodeUtf8(const std::u32string& str);

/**
 * @brief 将单个码点追加为 UTF-8
 */
void appendUtf8(std::string& out, char32_t cp);

// =============================================================================
// 字符类型判断
// =============================================================================

/**
 * @brief 是否为希伯来语注音/诵读符号 (U+0591 - U+05C7)
 *
 * 覆盖诵读符号、元音点、dagesh、shin/sin 点, 以及同一区段内的
 * maqaf、paseq、sof pasuq 等标记。
 */
bool isNiqqud(char32_t cp);

/**
 * @brief 是否为希伯来字母 (U+05D0 - U+05EA, 含词尾形式)
 */
bool isHebrewLetter(char32_t cp);

// =============================================================================
// 注音符号处理
// =============================================================================

/**
 * @brief 去除所有注音符号
 * @param text UTF-8 文本
 * @return 仅保留辅音与其他字符的文本
 * @note 幂等: removeNiqqud(removeNiqqud(x)) == removeNiqqud(x)
 */
std::string removeNiqqud(const std::string& text);

std::u32string removeNiqqud(const std::u32string& text);

// =============================================================================
// 空白处理
// =============================================================================

/**
 * @brief 去除首尾的空格与制表符 (保留换行)
 */
std::u32string trimSpaces(const std::u32string& text);

/**
 * @brief 将连续空格折叠为一个空格
 */
std::u32string collapseSpaces(const std::u32string& text);

}  // namespace text
}  // namespace niqqud

#endif  // NIQQUD_TEXT_UTILS_HPP
