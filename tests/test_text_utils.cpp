#include <gtest/gtest.h>

#include <string>

#include "internal/text/text_utils.hpp"

using namespace niqqud::text;

TEST(TextUtilsTest, DecodesHebrewAndAscii) {
    auto cps = decodeUtf8("a שלום");
    ASSERT_EQ(cps.size(), 6u);
    EXPECT_EQ(cps[0], U'a');
    EXPECT_EQ(cps[1], U' ');
    EXPECT_EQ(cps[2], 0x05E9);
    EXPECT_EQ(cps[5], 0x05DD);
}

TEST(TextUtilsTest, EncodeInvertsDecode) {
    std::string text = "שָׁלוֹם, world! 123 \xF0\x9F\x98\x80";
    EXPECT_EQ(encodeUtf8(decodeUtf8(text)), text);
}

TEST(TextUtilsTest, InvalidBytesBecomeReplacementChar) {
    auto cps = decodeUtf8(std::string("a\xFF" "b"));
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1], 0xFFFD);

    auto truncated = decodeUtf8(std::string("a\xD7"));
    ASSERT_EQ(truncated.size(), 2u);
    EXPECT_EQ(truncated[1], 0xFFFD);
}

TEST(TextUtilsTest, ClassifiesHebrewCodePoints) {
    EXPECT_TRUE(isNiqqud(0x0591));
    EXPECT_TRUE(isNiqqud(0x05B8));
    EXPECT_TRUE(isNiqqud(0x05C7));
    EXPECT_FALSE(isNiqqud(0x05D0));
    EXPECT_FALSE(isNiqqud(0x0590));

    EXPECT_TRUE(isHebrewLetter(0x05D0));
    EXPECT_TRUE(isHebrewLetter(0x05EA));
    EXPECT_FALSE(isHebrewLetter(0x05BC));
}

TEST(TextUtilsTest, RemovesNiqqudFromUtf8) {
    EXPECT_EQ(removeNiqqud("שָׁלוֹם"), "שלום");
    EXPECT_EQ(removeNiqqud("בְּרֵאשִׁית בָּרָא"), "בראשית ברא");
}

TEST(TextUtilsTest, RemovesCantillationAndPunctuationMarks) {
    // etnahta U+0591, maqaf U+05BE, sof pasuq U+05C3
    std::string text = "א֑ב־ג׃";
    EXPECT_EQ(removeNiqqud(text), "אבג");
}

TEST(TextUtilsTest, RemoveNiqqudIsIdempotent) {
    std::string text = "וַיֹּאמֶר אֱלֹהִים, \"Hello\" 42";
    auto once = removeNiqqud(text);
    EXPECT_EQ(removeNiqqud(once), once);
}

TEST(TextUtilsTest, RemoveNiqqudKeepsOtherText) {
    EXPECT_EQ(removeNiqqud("plain text"), "plain text");
    EXPECT_EQ(removeNiqqud(""), "");
    std::string invalid("\xFF\xD6");
    EXPECT_EQ(removeNiqqud(invalid), invalid);
}

TEST(TextUtilsTest, RemoveNiqqudOnCodePoints) {
    std::u32string text = U"שָׁלום";
    EXPECT_EQ(removeNiqqud(text), U"שלום");
}

TEST(TextUtilsTest, TrimsSpacesAndTabsOnly) {
    EXPECT_EQ(trimSpaces(U" \t abc \t "), U"abc");
    EXPECT_EQ(trimSpaces(U"\nabc\n"), U"\nabc\n");
    EXPECT_EQ(trimSpaces(U"   "), U"");
}

TEST(TextUtilsTest, CollapsesSpaceRuns) {
    EXPECT_EQ(collapseSpaces(U"a   b  c"), U"a b c");
    EXPECT_EQ(collapseSpaces(U"a\t\tb"), U"a\t\tb");
    EXPECT_EQ(collapseSpaces(U""), U"");
}
