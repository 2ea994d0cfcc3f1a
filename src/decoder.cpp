#include "internal/decoder.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace niqqud {

Decoder::Decoder(const text::AlphabetCodec& codec)
    : codec_(codec) {
}

int Decoder::argmax(const ScoreMatrix& scores, int64_t row) {
    int best_idx = 0;
    float best_val = -std::numeric_limits<float>::infinity();
    for (int64_t c = 0; c < scores.cols; ++c) {
        float val = scores.at(row, c);
        if (val > best_val) {
            best_val = val;
            best_idx = static_cast<int>(c);
        }
    }
    return best_idx;
}

std::u32string Decoder::merge(const std::u32string& letters,
                              const std::vector<int64_t>& normalized_indices,
                              const ChannelPredictions& predictions,
                              size_t seq_len) const {
    std::u32string result;
    result.reserve(seq_len * 4);

    size_t limit = std::min({seq_len, letters.size(), normalized_indices.size()});
    for (size_t i = 0; i < limit; ++i) {
        if (normalized_indices[i] == text::AlphabetCodec::MASK_INDEX) {
            break;
        }
        auto row = static_cast<int64_t>(i);
        if (row >= predictions.niqqud.rows || row >= predictions.dagesh.rows ||
            row >= predictions.sin.rows) {
            break;
        }

        char32_t letter = letters[i];
        result.push_back(letter);

        if (codec_.canTakeDagesh(letter)) {
            char32_t mark = codec_.dageshMark(argmax(predictions.dagesh, row));
            if (mark) result.push_back(mark);
        }

        if (codec_.canTakeSinDot(letter)) {
            char32_t mark = codec_.sinMark(argmax(predictions.sin, row));
            if (mark) result.push_back(mark);
        }

        if (codec_.canTakeNiqqud(letter)) {
            char32_t mark = codec_.niqqudMark(argmax(predictions.niqqud, row));
            if (mark) result.push_back(mark);
        }
    }

    return result;
}

std::u32string Decoder::joinChunks(const std::vector<std::u32string>& outputs) {
    std::u32string joined;
    for (const auto& part : outputs) {
        joined += part;
    }
    return text::collapseSpaces(joined);
}

}  // namespace niqqud
