#include "internal/text/text_utils.hpp"

#include <string>

namespace niqqud {
namespace text {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool isHorizontalSpace(char32_t cp) {
    return cp == U' ' || cp == U'\t';
}

}  // namespace

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

std::u32string decodeUtf8(const std::string& str) {
    std::u32string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.length();) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        int char_len = 1;
        char32_t cp = 0;

        // Determine UTF-8 character length
        if ((c & 0x80) == 0) {
            char_len = 1;  // ASCII
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            char_len = 2;  // 2-byte UTF-8
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            char_len = 3;  // 3-byte UTF-8
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            char_len = 4;  // 4-byte UTF-8
            cp = c & 0x07;
        } else {
            result.push_back(kReplacementChar);
            i += 1;
            continue;
        }

        if (i + char_len > str.length()) {
            result.push_back(kReplacementChar);
            break;
        }

        bool valid = true;
        for (int k = 1; k < char_len; ++k) {
            unsigned char cc = static_cast<unsigned char>(str[i + k]);
            if (!isContinuation(cc)) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (!valid) {
            result.push_back(kReplacementChar);
            i += 1;
            continue;
        }

        result.push_back(cp);
        i += char_len;
    }
    return result;
}

void appendUtf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        appendUtf8(out, kReplacementChar);
    }
}

std::string encodeUtf8(const std::u32string& str) {
    std::string result;
    result.reserve(str.size() * 2);
    for (char32_t cp : str) {
        appendUtf8(result, cp);
    }
    return result;
}

// =============================================================================
// 字符类型判断
// =============================================================================

bool isNiqqud(char32_t cp) {
    return cp >= 0x0591 && cp <= 0x05C7;
}

bool isHebrewLetter(char32_t cp) {
    return cp >= 0x05D0 && cp <= 0x05EA;
}

// =============================================================================
// 注音符号处理
// =============================================================================

std::u32string removeNiqqud(const std::u32string& text) {
    std::u32string result;
    result.reserve(text.size());
    for (char32_t cp : text) {
        if (!isNiqqud(cp)) {
            result.push_back(cp);
        }
    }
    return result;
}

std::string removeNiqqud(const std::string& text) {
    // Byte-level filter so invalid UTF-8 elsewhere in the text is preserved as is.
    // Every mark in U+0591..U+05C7 encodes as D6 91..D6 BF or D7 80..D7 87.
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c0 = static_cast<unsigned char>(text[i]);
        if (i + 1 < text.size()) {
            unsigned char c1 = static_cast<unsigned char>(text[i + 1]);
            if ((c0 == 0xD6 && c1 >= 0x91 && c1 <= 0xBF) ||
                (c0 == 0xD7 && c1 >= 0x80 && c1 <= 0x87)) {
                ++i;
                continue;
            }
        }
        result.push_back(text[i]);
    }
    return result;
}

// =============================================================================
// 空白处理
// =============================================================================

std::u32string trimSpaces(const std::u32string& text) {
    size_t start = 0;
    while (start < text.size() && isHorizontalSpace(text[start])) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && isHorizontalSpace(text[end - 1])) {
        --end;
    }
    return text.substr(start, end - start);
}

std::u32string collapseSpaces(const std::u32string& text) {
    std::u32string result;
    result.reserve(text.size());
    for (char32_t cp : text) {
        if (cp == U' ' && !result.empty() && result.back() == U' ') {
            continue;
        }
        result.push_back(cp);
    }
    return result;
}

}  // namespace text
}  // namespace niqqud
