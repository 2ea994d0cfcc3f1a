#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "internal/decoder.hpp"
#include "internal/text/alphabet_codec.hpp"

using niqqud::ChannelPredictions;
using niqqud::Decoder;
using niqqud::ScoreMatrix;
using niqqud::text::AlphabetCodec;

namespace {

void setHot(ScoreMatrix& m, int64_t row, int cls) {
    m.data[static_cast<size_t>(row * m.cols + cls)] = 1.0f;
}

// Same class on every row of each channel
ChannelPredictions uniform(int64_t rows, int niqqud_cls, int dagesh_cls, int sin_cls) {
    ChannelPredictions p;
    p.niqqud = ScoreMatrix::zeros(rows, AlphabetCodec::NIQQUD_CLASSES);
    p.dagesh = ScoreMatrix::zeros(rows, AlphabetCodec::DAGESH_CLASSES);
    p.sin = ScoreMatrix::zeros(rows, AlphabetCodec::SIN_CLASSES);
    for (int64_t r = 0; r < rows; ++r) {
        setHot(p.niqqud, r, niqqud_cls);
        setHot(p.dagesh, r, dagesh_cls);
        setHot(p.sin, r, sin_cls);
    }
    return p;
}

}  // namespace

class DecoderTest : public ::testing::Test {
protected:
    DecoderTest() : decoder_(codec_) {}

    std::u32string run(const std::u32string& letters, const ChannelPredictions& p) {
        auto indices = codec_.encodeText(letters);
        return decoder_.merge(letters, indices, p, letters.size());
    }

    AlphabetCodec codec_;
    Decoder decoder_;
};

TEST(DecoderArgmaxTest, FirstMaximumWins) {
    ScoreMatrix m;
    m.rows = 1;
    m.cols = 4;
    m.data = {0.1f, 0.7f, 0.7f, 0.2f};
    EXPECT_EQ(Decoder::argmax(m, 0), 1);

    m.data = {-3.0f, -2.0f, -5.0f, -2.5f};
    EXPECT_EQ(Decoder::argmax(m, 0), 1);

    float nan = std::numeric_limits<float>::quiet_NaN();
    m.data = {nan, 0.1f, nan, 0.0f};
    EXPECT_EQ(Decoder::argmax(m, 0), 1);
}

TEST_F(DecoderTest, IdentityModelLeavesLettersUnmarked) {
    std::u32string letters = U"שלום";
    EXPECT_EQ(run(letters, uniform(4, 0, 0, 0)), letters);
    EXPECT_EQ(run(letters, uniform(4, 1, 1, 1)), letters);
}

TEST_F(DecoderTest, MarksFollowDageshSinVowelOrder) {
    // shin + dagesh + shin dot + qamats
    std::u32string expected = {0x05E9, 0x05BC, 0x05C1, 0x05B8};
    EXPECT_EQ(run(U"ש", uniform(1, 10, 2, 2)), expected);

    std::u32string sin_dot = {0x05E9, 0x05C2, 0x05B4};
    EXPECT_EQ(run(U"ש", uniform(1, 6, 0, 3)), sin_dot);
}

TEST_F(DecoderTest, IneligibleChannelsAreNeverMaterialized) {
    auto p = uniform(1, 10, 2, 2);
    // alef: vowel only
    EXPECT_EQ(run(U"א", p), (std::u32string{0x05D0, 0x05B8}));
    // bet: dagesh and vowel, never a shin dot
    EXPECT_EQ(run(U"ב", p), (std::u32string{0x05D1, 0x05BC, 0x05B8}));
    // final mem: nothing
    EXPECT_EQ(run(U"ם", p), U"ם");
    // punctuation and unknown characters keep their original code point
    EXPECT_EQ(run(U"a!", uniform(2, 10, 2, 2)), U"a!");
}

TEST_F(DecoderTest, KeepsOriginalLetterNotNormalizedSymbol) {
    std::u32string letters = U"x\n7";
    EXPECT_EQ(run(letters, uniform(3, 10, 2, 2)), letters);
}

TEST_F(DecoderTest, StopsAtMask) {
    std::u32string letters = U"אב";
    std::vector<int64_t> indices = {codec_.encode(U'א'), AlphabetCodec::MASK_INDEX};
    auto out = decoder_.merge(letters, indices, uniform(2, 0, 0, 0), 2);
    EXPECT_EQ(out, U"א");
}

TEST_F(DecoderTest, StopsWhenScoreRowsRunOut) {
    std::u32string letters = U"אבג";
    auto out = decoder_.merge(letters, codec_.encodeText(letters), uniform(2, 0, 0, 0), 3);
    EXPECT_EQ(out, U"אב");
}

TEST_F(DecoderTest, PaddedRowsBeyondSequenceAreIgnored) {
    std::u32string letters = U"אב";
    auto out = decoder_.merge(letters, codec_.encodeText(letters), uniform(10, 2, 0, 0), 2);
    EXPECT_EQ(out, (std::u32string{0x05D0, 0x05B0, 0x05D1, 0x05B0}));
}

TEST_F(DecoderTest, JoinConcatenatesAndCollapsesSpaces) {
    EXPECT_EQ(Decoder::joinChunks({U"שלום ", U"עולם "}), U"שלום עולם ");
    EXPECT_EQ(Decoder::joinChunks({U"a  ", U" b"}), U"a b");
    // mid-word cut: no separator
    EXPECT_EQ(Decoder::joinChunks({U"אבג", U"דהו "}), U"אבגדהו ");
    EXPECT_EQ(Decoder::joinChunks({}), U"");
}
