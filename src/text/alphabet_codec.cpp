#include "internal/text/alphabet_codec.hpp"

#include <cstdint>

#include <string>
#include <unordered_map>
#include <vector>

namespace niqqud {
namespace text {

namespace {

// =============================================================================
// 输入字符表
// =============================================================================

const char32_t kLetters[] = {
    U'\0',                                      // 0: MASK
    U'H', U'O', U'5',                           // 1-3: 合字 / 未知 / 数字
    U' ', U'!', U'"', U'\'', U'(', U')',        // 4-9
    U',', U'-', U'.', U':', U';', U'?',         // 10-15
    0x05D0, 0x05D1, 0x05D2, 0x05D3, 0x05D4,     // 16-20: א ב ג ד ה
    0x05D5, 0x05D6, 0x05D7, 0x05D8, 0x05D9,     // 21-25: ו ז ח ט י
    0x05DA, 0x05DB, 0x05DC, 0x05DD, 0x05DE,     // 26-30: ך כ ל ם מ
    0x05DF, 0x05E0, 0x05E1, 0x05E2, 0x05E3,     // 31-35: ן נ ס ע ף
    0x05E4, 0x05E5, 0x05E6, 0x05E7, 0x05E8,     // 36-40: פ ץ צ ק ר
    0x05E9, 0x05EA,                             // 41-42: ש ת
};

constexpr size_t kLettersSize = sizeof(kLetters) / sizeof(kLetters[0]);

// =============================================================================
// 输出通道类别表
// =============================================================================

const char32_t kNiqqudMarks[AlphabetCodec::NIQQUD_CLASSES] = {
    0,          // 0: MASK
    0x05BF,     // 1: RAFE
    0x05B0,     // 2: SHVA
    0x05B1,     // 3: HATAF SEGOL
    0x05B2,     // 4: HATAF PATAH
    0x05B3,     // 5: HATAF QAMATS
    0x05B4,     // 6: HIRIQ
    0x05B5,     // 7: TSERE
    0x05B6,     // 8: SEGOL
    0x05B7,     // 9: PATAH
    0x05B8,     // 10: QAMATS
    0x05B9,     // 11: HOLAM
    0x05BA,     // 12: HOLAM HASER FOR VAV
    0x05BB,     // 13: QUBUTS
    0x05BC,     // 14: SHURUQ (DAGESH glyph)
    0x05B7,     // 15: PATAH (second class)
};

const char32_t kDageshMarks[AlphabetCodec::DAGESH_CLASSES] = {
    0,          // 0: MASK
    0x05BF,     // 1: RAFE
    0x05BC,     // 2: DAGESH
};

const char32_t kSinMarks[AlphabetCodec::SIN_CLASSES] = {
    0,          // 0: MASK
    0x05BF,     // 1: RAFE
    0x05C1,     // 2: SHIN DOT
    0x05C2,     // 3: SIN DOT
};

// =============================================================================
// 字母资格集合
// =============================================================================

// בגדהוזטיכלמנספצקשת + ךף
const std::u32string kDageshLetters =
    U"בגדהוזטיכל"
    U"מנספצקשת"
    U"ךף";

// ש
const std::u32string kSinLetters = U"ש";

// אבגדהוזחטיכלמנסעפצקרשת + ךן
const std::u32string kNiqqudLetters =
    U"אבגדהוזחטי"
    U"כלמנסעפצקר"
    U"שת"
    U"ךן";

// =============================================================================
// 规范化映射
// =============================================================================

// ־ ‒ – — ― −
const std::u32string kDashes = U"־‒–—―−";

// ´ ‘ ’
const std::u32string kSingleQuotes = U"´‘’";

// “ ” ״
const std::u32string kDoubleQuotes = U"“”״";

// װ ױ ײ
const std::u32string kLigatures = U"װױײ";

constexpr char32_t kEllipsis = 0x2026;

// Code points of digit zero for every Nd block; each block holds ten digits.
const char32_t kDigitZeros[] = {
    0x0030, 0x0660, 0x06F0, 0x07C0, 0x0966, 0x09E6, 0x0A66, 0x0AE6,
    0x0B66, 0x0BE6, 0x0C66, 0x0CE6, 0x0D66, 0x0DE6, 0x0E50, 0x0ED0,
    0x0F20, 0x1040, 0x1090, 0x17E0, 0x1810, 0x1946, 0x19D0, 0x1A80,
    0x1A90, 0x1B50, 0x1BB0, 0x1C40, 0x1C50, 0xA620, 0xA8D0, 0xA900,
    0xA9D0, 0xA9F0, 0xAA50, 0xABF0, 0xFF10, 0x104A0, 0x10D30, 0x11066,
    0x110F0, 0x11136, 0x111D0, 0x112F0, 0x11450, 0x114D0, 0x11650, 0x116C0,
    0x11730, 0x118E0, 0x11950, 0x11C50, 0x11D50, 0x11DA0, 0x16A60, 0x16AC0,
    0x16B50, 0x1D7CE, 0x1D7D8, 0x1D7E2, 0x1D7EC, 0x1D7F6, 0x1E140, 0x1E2F0,
    0x1E950, 0x1FBF0,
};

bool contains(const std::u32string& set, char32_t ch) {
    return set.find(ch) != std::u32string::npos;
}

char32_t markAt(const char32_t* table, int size, int cls) {
    if (cls < AlphabetCodec::FIRST_MARK_CLASS || cls >= size) {
        return 0;
    }
    return table[cls];
}

}  // namespace

// =============================================================================
// 构造
// =============================================================================

AlphabetCodec::AlphabetCodec(bool fold_final_forms)
    : fold_final_forms_(fold_final_forms) {
    for (size_t i = 0; i < kLettersSize; ++i) {
        if (kLetters[i] != MASK_SYMBOL) {
            symbol_to_index_[kLetters[i]] = static_cast<int64_t>(i);
        }
    }
}

size_t AlphabetCodec::vocabularySize() {
    return kLettersSize;
}

// =============================================================================
// 规范化与编解码
// =============================================================================

char32_t AlphabetCodec::normalize(char32_t ch) const {
    if (fold_final_forms_) {
        char32_t folded = foldFinalForm(ch);
        if (folded != ch) return folded;
    }
    if (symbol_to_index_.count(ch)) return ch;
    if (ch == U'\n' || ch == U'\t') return U' ';
    if (contains(kDashes, ch)) return U'-';
    if (ch == U'[') return U'(';
    if (ch == U']') return U')';
    if (contains(kSingleQuotes, ch)) return U'\'';
    if (contains(kDoubleQuotes, ch)) return U'"';
    if (isDecimalDigit(ch)) return DIGIT_SYMBOL;
    if (ch == kEllipsis) return U',';
    if (contains(kLigatures, ch)) return LIGATURE_SYMBOL;
    return UNKNOWN_SYMBOL;
}

int64_t AlphabetCodec::encode(char32_t symbol) const {
    auto it = symbol_to_index_.find(symbol);
    if (it == symbol_to_index_.end()) {
        return UNKNOWN_INDEX;
    }
    return it->second;
}

char32_t AlphabetCodec::decode(int64_t index) const {
    if (index < 0 || index >= static_cast<int64_t>(kLettersSize)) {
        return UNKNOWN_SYMBOL;
    }
    return kLetters[index];
}

std::vector<int64_t> AlphabetCodec::encodeText(const std::u32string& text) const {
    std::vector<int64_t> indices;
    indices.reserve(text.size());
    for (char32_t ch : text) {
        indices.push_back(encode(normalize(ch)));
    }
    return indices;
}

// =============================================================================
// 字母资格
// =============================================================================

bool AlphabetCodec::canTakeDagesh(char32_t letter) {
    return contains(kDageshLetters, letter);
}

bool AlphabetCodec::canTakeSinDot(char32_t letter) {
    return contains(kSinLetters, letter);
}

bool AlphabetCodec::canTakeNiqqud(char32_t letter) {
    return contains(kNiqqudLetters, letter);
}

// =============================================================================
// 输出通道
// =============================================================================

char32_t AlphabetCodec::niqqudMark(int cls) {
    return markAt(kNiqqudMarks, NIQQUD_CLASSES, cls);
}

char32_t AlphabetCodec::dageshMark(int cls) {
    return markAt(kDageshMarks, DAGESH_CLASSES, cls);
}

char32_t AlphabetCodec::sinMark(int cls) {
    return markAt(kSinMarks, SIN_CLASSES, cls);
}

// =============================================================================
// 辅助
// =============================================================================

char32_t AlphabetCodec::foldFinalForm(char32_t letter) {
    switch (letter) {
        case 0x05DA: return 0x05DB;  // ך → כ
        case 0x05DD: return 0x05DE;  // ם → מ
        case 0x05DF: return 0x05E0;  // ן → נ
        case 0x05E3: return 0x05E4;  // ף → פ
        case 0x05E5: return 0x05E6;  // ץ → צ
        default:     return letter;
    }
}

bool AlphabetCodec::isDecimalDigit(char32_t ch) {
    for (char32_t zero : kDigitZeros) {
        if (ch >= zero && ch < zero + 10) {
            return true;
        }
    }
    return false;
}

}  // namespace text
}  // namespace niqqud
