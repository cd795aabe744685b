#include <gtest/gtest.h>

#include "common/unicode.hpp"

namespace mdlex {
namespace {

TEST(Unicode, decode_ascii)
{
    const Code_Point c = decode_utf8("a", 0);
    EXPECT_EQ(c.value, U'a');
    EXPECT_EQ(c.length, 1u);
}

TEST(Unicode, decode_multi_byte)
{
    EXPECT_EQ(decode_utf8("é", 0).value, U'é');
    EXPECT_EQ(decode_utf8("é", 0).length, 2u);
    EXPECT_EQ(decode_utf8("x粗", 1).value, U'粗');
    EXPECT_EQ(decode_utf8("x粗", 1).length, 3u);
    EXPECT_EQ(decode_utf8("\U0001F600", 0).value, U'\U0001F600');
    EXPECT_EQ(decode_utf8("\U0001F600", 0).length, 4u);
}

TEST(Unicode, decode_malformed)
{
    // lone continuation byte
    EXPECT_EQ(decode_utf8("\x80", 0).value, replacement_character);
    EXPECT_EQ(decode_utf8("\x80", 0).length, 1u);
    // truncated sequence
    EXPECT_EQ(decode_utf8("\xe7\xb2", 0).value, replacement_character);
    EXPECT_EQ(decode_utf8("\xe7\xb2", 0).length, 1u);
    // lead byte followed by ASCII
    EXPECT_EQ(decode_utf8("\xc3" "a", 0).value, replacement_character);
    EXPECT_EQ(decode_utf8("\xff", 0).length, 1u);
}

TEST(Unicode, whitespace)
{
    EXPECT_TRUE(is_unicode_whitespace(U' '));
    EXPECT_TRUE(is_unicode_whitespace(U'\t'));
    EXPECT_TRUE(is_unicode_whitespace(U'\n'));
    EXPECT_TRUE(is_unicode_whitespace(U'\u00A0'));
    EXPECT_TRUE(is_unicode_whitespace(U'\u2003'));
    EXPECT_TRUE(is_unicode_whitespace(U'\u3000'));
    EXPECT_FALSE(is_unicode_whitespace(U'a'));
    EXPECT_FALSE(is_unicode_whitespace(U'\u200B'));
    EXPECT_FALSE(is_unicode_whitespace(replacement_character));
}

TEST(Unicode, match_whitespace)
{
    EXPECT_EQ(match_whitespace(""), 0u);
    EXPECT_EQ(match_whitespace("a "), 0u);
    EXPECT_EQ(match_whitespace(" \t a"), 3u);
    EXPECT_EQ(match_whitespace("\u3000a"), 3u);
    EXPECT_EQ(match_whitespace("  "), 2u);
}

TEST(Unicode, trim)
{
    EXPECT_EQ(trim_start("  a b  "), "a b  ");
    EXPECT_EQ(trim_end("  a b  "), "  a b");
    EXPECT_EQ(trim("  a b  "), "a b");
    EXPECT_EQ(trim(" \t\n"), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("\u3000中文\u3000"), "中文");
    EXPECT_EQ(trim_end("a\x80 "), "a\x80");
}

} // namespace
} // namespace mdlex
