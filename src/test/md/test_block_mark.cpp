#include <memory_resource>
#include <optional>

#include <gtest/gtest.h>

#include "md/block_mark.hpp"
#include "md/token.hpp"

#include "test/md/token_testing.hpp"

namespace mdlex {
namespace {

using enum md::Token_Type;

TEST(Block_Mark, title)
{
    EXPECT_TRUE(lexes_to("# header1\n", { { title_mark, "#" }, { text, "header1" } }));
    EXPECT_TRUE(lexes_to("## header2\n", { { title_mark, "##" }, { text, "header2" } }));
    EXPECT_TRUE(
        lexes_to("### header3 header3\n", { { title_mark, "###" }, { text, "header3 header3" } }));
    EXPECT_TRUE(lexes_to("####  header4\n", { { title_mark, "####" }, { text, " header4" } }));
    EXPECT_TRUE(lexes_to("# header1", { { title_mark, "#" }, { text, "header1" } }));
}

TEST(Block_Mark, title_without_content)
{
    EXPECT_TRUE(lexes_to("# \n", { { title_mark, "#" } }));
    EXPECT_TRUE(lexes_to("#  \n", { { title_mark, "#" } }));
    EXPECT_TRUE(lexes_to("# ", { { title_mark, "#" } }));
    EXPECT_TRUE(lexes_to("#  ", { { title_mark, "#" } }));
    EXPECT_TRUE(lexes_to("#", { { title_mark, "#" } }));
}

TEST(Block_Mark, not_a_title)
{
    EXPECT_TRUE(lexes_to("#这不是标题\n", { { text, "#这不是标题" } }));
    EXPECT_TRUE(lexes_to("##这也不是标题\n", { { text, "##这也不是标题" } }));
    EXPECT_TRUE(lexes_to("##### five\n", { { text, "##### five" } }));
}

TEST(Block_Mark, ordered_list)
{
    EXPECT_TRUE(lexes_to("1. rust\n", { { ordered_mark, "1." }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("2. rust\n", { { ordered_mark, "2." }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("10. rust\n", { { ordered_mark, "10." }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("20. rust\n", { { ordered_mark, "20." }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("100. rust\n", { { ordered_mark, "100." }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("999. rust\n", { { ordered_mark, "999." }, { text, "rust" } }));
}

TEST(Block_Mark, not_an_ordered_list)
{
    EXPECT_TRUE(lexes_to("1.这也不是列表\n", { { text, "1.这也不是列表" } }));
    EXPECT_TRUE(lexes_to("1000. rust\n", { { text, "1000. rust" } }));
    EXPECT_TRUE(lexes_to("0. rust\n", { { text, "0. rust" } }));
    EXPECT_TRUE(lexes_to("01. rust\n", { { text, "01. rust" } }));
    EXPECT_TRUE(lexes_to("1) rust\n", { { text, "1) rust" } }));
}

TEST(Block_Mark, quote)
{
    EXPECT_TRUE(lexes_to(
        "> Rust, A language empowering everyone to build reliable and efficient software.\n",
        { { quote_mark, ">" },
          { text,
            "Rust, A language empowering everyone to build reliable and efficient software." } }));
    EXPECT_TRUE(lexes_to(">这不是引用\n", { { text, ">这不是引用" } }));
}

TEST(Block_Mark, unordered_list)
{
    EXPECT_TRUE(lexes_to("* rust\n", { { unordered_mark, "*" }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("- rust\n", { { unordered_mark, "-" }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("+ rust\n", { { unordered_mark, "+" }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("*", { { unordered_mark, "*" } }));
    EXPECT_TRUE(lexes_to("- **bold**\n", { { unordered_mark, "-" },
                                            { bold_mark, "**" },
                                            { text, "bold" },
                                            { bold_mark, "**" } }));
}

TEST(Block_Mark, code_block)
{
    EXPECT_TRUE(lexes_to("```\n", { { code_block_mark, "```" } }));
    EXPECT_TRUE(lexes_to("```rust\n", { { code_block_mark, "```" }, { text, "rust" } }));
    EXPECT_TRUE(lexes_to("``` rust\n", { { code_block_mark, "```" }, { text, " rust" } }));
}

TEST(Block_Mark, dividing)
{
    EXPECT_TRUE(lexes_to("---\n", { { dividing_mark, "---" } }));
    EXPECT_TRUE(lexes_to("***\n", { { dividing_mark, "***" } }));
    EXPECT_TRUE(lexes_to("___\n", { { dividing_mark, "___" } }));
    EXPECT_TRUE(lexes_to("- -----\n", { { dividing_mark, "- -----" } }));
    EXPECT_TRUE(lexes_to("* * *\n", { { dividing_mark, "* * *" } }));
    EXPECT_TRUE(lexes_to("__ ________         \n", { { dividing_mark, "__ ________         " } }));
    EXPECT_TRUE(lexes_to("----------------------------------------   \n",
                         { { dividing_mark, "----------------------------------------   " } }));
    EXPECT_TRUE(lexes_to("---", { { dividing_mark, "---" } }));
}

TEST(Block_Mark, dividing_keeps_indentation)
{
    EXPECT_TRUE(lexes_to("  ---\n", { { dividing_mark, "  ---" } }));
    EXPECT_TRUE(lexes_to("\t* * *\n", { { dividing_mark, "\t* * *" } }));
}

TEST(Block_Mark, not_dividing)
{
    EXPECT_TRUE(lexes_to("--- x\n", { { text, "--- x" } }));
    EXPECT_TRUE(
        lexes_to("___ 这不是一个分界线\n", { { text, "___" }, { text, " 这不是一个分界线" } }));
    EXPECT_TRUE(lexes_to("***xxxx\n", { { text, "***" }, { text, "xxxx" } }));
    EXPECT_TRUE(lexes_to("--\n", { { text, "--" } }));
    EXPECT_TRUE(lexes_to("*-*\n", { { italic_mark, "*" }, { text, "-" }, { italic_mark, "*" } }));
}

TEST(Block_Mark, blank_line)
{
    EXPECT_TRUE(lexes_to("\n", { { blank_line, "" } }));
    EXPECT_TRUE(lexes_to("", { { blank_line, "" } }));
    EXPECT_TRUE(lexes_to(" \n", { { blank_line, " " } }));
    EXPECT_TRUE(lexes_to("     \n", { { blank_line, "     " } }));
    EXPECT_TRUE(lexes_to("         ", { { blank_line, "         " } }));
    EXPECT_TRUE(lexes_to("  ", { { blank_line, "  " } }));
    EXPECT_TRUE(lexes_to("\t \n", { { blank_line, "\t " } }));
}

TEST(Block_Mark, indentation)
{
    EXPECT_TRUE(lexes_to("  * item\n",
                         { { white_space, "  " }, { unordered_mark, "*" }, { text, "item" } }));
    EXPECT_TRUE(lexes_to("    plain text\n", { { white_space, "    " }, { text, "plain text" } }));
    EXPECT_TRUE(
        lexes_to("\t# title\n", { { white_space, "\t" }, { title_mark, "#" }, { text, "title" } }));
}

TEST(Block_Mark, is_dividing_line)
{
    EXPECT_TRUE(md::is_dividing_line("---"));
    EXPECT_TRUE(md::is_dividing_line("* * *\n"));
    EXPECT_TRUE(md::is_dividing_line("  _ _ _  "));
    EXPECT_FALSE(md::is_dividing_line("--"));
    EXPECT_FALSE(md::is_dividing_line("*-*"));
    EXPECT_FALSE(md::is_dividing_line("--- x"));
    EXPECT_FALSE(md::is_dividing_line(""));
    EXPECT_FALSE(md::is_dividing_line("+++"));
}

TEST(Block_Mark, block_mark_type)
{
    EXPECT_EQ(md::block_mark_type("#", "# a"), title_mark);
    EXPECT_EQ(md::block_mark_type("####", "#### a"), title_mark);
    EXPECT_EQ(md::block_mark_type("#####", "##### a"), std::nullopt);
    EXPECT_EQ(md::block_mark_type("12.", "12. a"), ordered_mark);
    EXPECT_EQ(md::block_mark_type(">", "> a"), quote_mark);
    EXPECT_EQ(md::block_mark_type("```cpp", "```cpp"), code_block_mark);
    EXPECT_EQ(md::block_mark_type("+", "+ a"), unordered_mark);
    EXPECT_EQ(md::block_mark_type("*", "* a"), unordered_mark);
    EXPECT_EQ(md::block_mark_type("*", "* * *"), dividing_mark);
    EXPECT_EQ(md::block_mark_type("___", "___"), dividing_mark);
    EXPECT_EQ(md::block_mark_type("___", "___ a"), std::nullopt);
    EXPECT_EQ(md::block_mark_type("text", "text"), std::nullopt);
}

TEST(Block_Mark, is_block_mark)
{
    EXPECT_TRUE(md::is_block_mark(title_mark));
    EXPECT_TRUE(md::is_block_mark(code_block_mark));
    EXPECT_TRUE(md::is_block_mark(dividing_mark));
    EXPECT_FALSE(md::is_block_mark(white_space));
    EXPECT_FALSE(md::is_block_mark(blank_line));
    EXPECT_FALSE(md::is_block_mark(bold_mark));
    EXPECT_FALSE(md::is_block_mark(text));
}

TEST(Block_Mark, lex_block_mark_returns_inline_begin)
{
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::vector<md::Token> tokens(&memory);

    EXPECT_EQ(md::lex_block_mark(tokens, "## abc\n"), 3);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, title_mark);

    tokens.clear();
    EXPECT_EQ(md::lex_block_mark(tokens, "  abc\n"), 2);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, white_space);

    tokens.clear();
    EXPECT_EQ(md::lex_block_mark(tokens, "```js\n"), 3);

    tokens.clear();
    EXPECT_EQ(md::lex_block_mark(tokens, "---\n"), std::nullopt);
    EXPECT_EQ(md::lex_block_mark(tokens, "   \n"), std::nullopt);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, dividing_mark);
    EXPECT_EQ(tokens[1].type, blank_line);
}

} // namespace
} // namespace mdlex
