#include <gtest/gtest.h>
#include <mediacat/core/utf8.h>

using mediacat::common::latin1ToUtf8;
using mediacat::common::sanitizeUtf8;

TEST(Utf8Test, ValidInputIsUnchanged) {
    const std::string text = "plain ascii, caf\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
    EXPECT_EQ(sanitizeUtf8(text), text);
}

TEST(Utf8Test, InvalidBytesBecomeReplacementCharacter) {
    const std::string input = std::string("Exif\0\0", 6) + "\xFF\xFE" + "ok";
    const std::string out = sanitizeUtf8(input);

    EXPECT_EQ(out, std::string("Exif\0\0", 6) + "\xEF\xBF\xBD\xEF\xBF\xBD" + "ok");
}

TEST(Utf8Test, OverlongAndSurrogateSequencesAreRejected) {
    EXPECT_EQ(sanitizeUtf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    // U+D800 encoded directly
    EXPECT_EQ(sanitizeUtf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(Utf8Test, TruncatedSequenceAtEnd) {
    EXPECT_EQ(sanitizeUtf8("abc\xE2\x82"), "abc\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST(Utf8Test, Latin1Conversion) {
    EXPECT_EQ(latin1ToUtf8("caf\xE9"), "caf\xC3\xA9");
    EXPECT_EQ(latin1ToUtf8("ascii"), "ascii");
}
