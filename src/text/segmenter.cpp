#include "internal/text/segmenter.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace niqqud {
namespace text {

Segmenter::Segmenter(const AlphabetCodec& codec)
    : codec_(codec) {
}

bool Segmenter::isBoundary(char32_t ch) const {
    return codec_.normalize(ch) == U' ';
}

std::vector<std::u32string> Segmenter::split(const std::u32string& text, size_t max_length) const {
    std::vector<std::u32string> segments;
    if (text.empty()) {
        return segments;
    }
    if (max_length <= 1) {
        segments.push_back(text);
        return segments;
    }

    const size_t window = max_length - 1;
    std::u32string current;
    current.reserve(window);
    size_t last_space = std::u32string::npos;

    for (char32_t ch : text) {
        if (isBoundary(ch)) {
            last_space = current.size();
        }
        current.push_back(ch);

        if (current.size() == window) {
            // No boundary in the window: cut mid-word at the window edge
            size_t cutoff = (last_space == std::u32string::npos)
                ? current.size()
                : std::min(last_space + 1, current.size());
            segments.push_back(current.substr(0, cutoff));
            current.erase(0, cutoff);
            last_space = std::u32string::npos;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

}  // namespace text
}  // namespace niqqud
