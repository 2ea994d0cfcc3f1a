#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "internal/text/alphabet_codec.hpp"
#include "internal/text/segmenter.hpp"

using niqqud::text::AlphabetCodec;
using niqqud::text::Segmenter;

class SegmenterTest : public ::testing::Test {
protected:
    SegmenterTest() : segmenter_(codec_) {}

    static std::u32string concat(const std::vector<std::u32string>& chunks) {
        std::u32string joined;
        for (const auto& c : chunks) joined += c;
        return joined;
    }

    AlphabetCodec codec_;
    Segmenter segmenter_;
};

TEST_F(SegmenterTest, EmptyTextHasNoChunks) {
    EXPECT_TRUE(segmenter_.split(U"", 10).empty());
}

TEST_F(SegmenterTest, ShortTextIsOneChunk) {
    auto chunks = segmenter_.split(U"שלום עולם ", 100);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], U"שלום עולם ");
}

TEST_F(SegmenterTest, DegenerateLengthReturnsWholeText) {
    auto chunks = segmenter_.split(U"abc def", 1);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], U"abc def");
}

TEST_F(SegmenterTest, CutsAfterLastSpace) {
    // window = 9
    std::u32string text = U"אבג דהו זחט יכל ";
    auto chunks = segmenter_.split(text, 10);
    ASSERT_GE(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], U"אבג דהו ");
    EXPECT_EQ(chunks[1], U"זחט יכל ");
    EXPECT_EQ(concat(chunks), text);
}

TEST_F(SegmenterTest, ChunksEndAtOriginalSpaces) {
    std::u32string text = U"one two three four five six seven eight nine ten ";
    auto chunks = segmenter_.split(text, 12);
    ASSERT_GE(chunks.size(), 2u);
    for (const auto& c : chunks) {
        EXPECT_LT(c.size(), 12u);
        EXPECT_EQ(c.back(), U' ');
    }
    EXPECT_EQ(concat(chunks), text);
}

TEST_F(SegmenterTest, LongWordIsCutMidToken) {
    std::u32string word(25, U'א');
    auto chunks = segmenter_.split(word, 10);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].size(), 9u);
    EXPECT_EQ(chunks[1].size(), 9u);
    EXPECT_EQ(chunks[2].size(), 7u);
    EXPECT_EQ(concat(chunks), word);
}

TEST_F(SegmenterTest, NewlinesAndTabsAreBoundaries) {
    EXPECT_TRUE(segmenter_.isBoundary(U' '));
    EXPECT_TRUE(segmenter_.isBoundary(U'\n'));
    EXPECT_TRUE(segmenter_.isBoundary(U'\t'));
    EXPECT_FALSE(segmenter_.isBoundary(U'-'));
    EXPECT_FALSE(segmenter_.isBoundary(U'א'));

    auto chunks = segmenter_.split(U"abcd\nefgh\tijkl", 8);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0], U"abcd\n");
    EXPECT_EQ(chunks[1], U"efgh\t");
    EXPECT_EQ(chunks[2], U"ijkl");
}

TEST_F(SegmenterTest, NoMidWordCutWhenWordsFit) {
    std::u32string text;
    for (int i = 0; i < 200; ++i) {
        text += (i % 3 == 0) ? U"שלום " : U"אבגדהו ";
    }
    for (size_t max_length : {8u, 9u, 16u, 31u, 64u}) {
        auto chunks = segmenter_.split(text, max_length);
        EXPECT_EQ(concat(chunks), text);
        for (size_t i = 0; i < chunks.size(); ++i) {
            EXPECT_LT(chunks[i].size(), max_length);
            if (i + 1 < chunks.size()) {
                EXPECT_EQ(chunks[i].back(), U' ') << "max_length " << max_length;
            }
        }
    }
}
