// =============================================================================
// UTF-8 and Text Utility Tests
// =============================================================================

#include <gtest/gtest.h>
#include "dreamgroup/util/text.hpp"
#include "dreamgroup/util/utf8.hpp"

using namespace dreamgroup::util;

class Utf8Test : public ::testing::Test {};

TEST_F(Utf8Test, DecodesMixedWidthSequences) {
    // "aש€😀"
    auto cps = decode_utf8("a\xD7\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
    ASSERT_EQ(cps.size(), 4u);
    EXPECT_EQ(cps[0], 0x61u);
    EXPECT_EQ(cps[1], 0x05E9u);
    EXPECT_EQ(cps[2], 0x20ACu);
    EXPECT_EQ(cps[3], 0x1F600u);
}

TEST_F(Utf8Test, InvalidBytesBecomeReplacementCharacter) {
    auto cps = decode_utf8("a\xFF" "b");
    ASSERT_EQ(cps.size(), 3u);
    EXPECT_EQ(cps[1], 0xFFFDu);
    EXPECT_EQ(cps[2], static_cast<uint32_t>('b'));
}

TEST_F(Utf8Test, EncodeMatchesDecode) {
    for (uint32_t cp : {0x41u, 0x05D0u, 0x0436u, 0x20ACu, 0x1F600u}) {
        auto back = decode_utf8(encode_utf8(cp));
        ASSERT_EQ(back.size(), 1u);
        EXPECT_EQ(back[0], cp);
    }
}

TEST_F(Utf8Test, DetectsScripts) {
    EXPECT_EQ(detect_script("become a doctor"), Script::LATIN);
    EXPECT_EQ(detect_script("\xD7\x9C\xD7\x94\xD7\x99\xD7\x95\xD7\xAA \xD7\xA8\xD7\x95\xD7\xA4\xD7\x90"), Script::HEBREW);
    EXPECT_EQ(detect_script("\xD8\xB7\xD8\xA8\xD9\x8A\xD8\xA8"), Script::ARABIC);
    EXPECT_EQ(detect_script("\xD0\xB2\xD1\x80\xD0\xB0\xD1\x87"), Script::CYRILLIC);
    // Latin letters with diacritics stay Latin
    EXPECT_EQ(detect_script("caf\xC3\xA9"), Script::LATIN);
}

TEST_F(Utf8Test, ContainsScript) {
    EXPECT_TRUE(contains_script("to be \xD7\xA8\xD7\x95\xD7\xA4\xD7\x90", Script::HEBREW));
    EXPECT_FALSE(contains_script("to be a doctor", Script::HEBREW));
    EXPECT_FALSE(contains_script("\xD7\xA8\xD7\x95\xD7\xA4\xD7\x90", Script::LATIN));
}

class TextTest : public ::testing::Test {};

TEST_F(TextTest, LowerCaseLeavesMultibyteAlone) {
    EXPECT_EQ(to_lower("Become A DOCTOR"), "become a doctor");
    EXPECT_EQ(to_lower("\xD7\xA8\xD7\x95"), "\xD7\xA8\xD7\x95");
}

TEST_F(TextTest, TrimAndCollapse) {
    EXPECT_EQ(trim("  \tto fly\n "), "to fly");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(collapse_whitespace("  to   fly \t high  "), "to fly high");
}

TEST_F(TextTest, StripCharsRepeatsAtBothEnds) {
    EXPECT_EQ(strip_chars("'to fly!.'", "'.!"), "to fly");
    EXPECT_EQ(strip_chars(" . ", "."), "");
}

TEST_F(TextTest, SplitKeepsEmptyFields) {
    auto fields = split("a\t\tb", '\t');
    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[1], "");
    EXPECT_EQ(split_words("  to  fly  ").size(), 2u);
}

TEST_F(TextTest, LettersAndSpaces) {
    EXPECT_TRUE(is_letters_and_spaces("Digital Creator"));
    EXPECT_FALSE(is_letters_and_spaces("Career1"));
    EXPECT_FALSE(is_letters_and_spaces("   "));
    EXPECT_FALSE(is_letters_and_spaces(""));
}
