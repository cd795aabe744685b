#include <algorithm>

#include "common/assert.hpp"

#include "md/block_mark.hpp"
#include "md/inline.hpp"
#include "md/lex.hpp"

namespace mdlex::md {

void lex_line(std::pmr::vector<Token>& out, std::string_view line, const Lex_Options& options)
{
    MDLEX_ASSERT(line.find('\n') == std::string_view::npos
                 || line.find('\n') == line.length() - 1);
    MDLEX_ASSERT(options.validator != nullptr);

    const std::optional<Size> inline_begin = lex_block_mark(out, line);
    if (!inline_begin) {
        return;
    }
    tokenize_inline(out, line.substr(std::min(*inline_begin, line.length())), *options.validator);
}

std::pmr::vector<Token> lex_line(std::string_view line, std::pmr::memory_resource* memory)
{
    std::pmr::vector<Token> result(memory);
    lex_line(result, line);
    return result;
}

Line_Kind classify_line(std::span<const Token> tokens)
{
    using enum Token_Type;

    if (!tokens.empty() && tokens.front().type == white_space) {
        tokens = tokens.subspan(1);
    }
    if (tokens.empty()) {
        return Line_Kind::unknown;
    }
    switch (tokens.front().type) {
    case blank_line: return Line_Kind::blank;
    case title_mark: return Line_Kind::title;
    case unordered_mark:
    case ordered_mark: return Line_Kind::list_item;
    case quote_mark: return Line_Kind::quote;
    case code_block_mark:
    case dividing_mark:
    case white_space: return Line_Kind::unknown;
    case bold_mark:
    case italic_mark:
    case italic_bold_mark:
    case code_mark:
    case line_break:
    case image:
    case link:
    case quick_link:
    case ref_link:
    case ref_link_def:
    case text:
    case star:
    case underline:
    case back_tick: return Line_Kind::plain;
    }
    MDLEX_ASSERT_UNREACHABLE("Unknown token type.");
}

std::pmr::vector<Lexed_Line>
lex_lines(std::string_view source, const Lex_Options& options, std::pmr::memory_resource* memory)
{
    std::pmr::vector<Lexed_Line> result(memory);

    for (Size begin = 0, line = 0; begin < source.length(); ++line) {
        const Size newline = source.find('\n', begin);
        const Size end = newline == std::string_view::npos ? source.length() : newline + 1;

        Lexed_Line& lexed = result.emplace_back(Lexed_Line {
            .line = line, .kind = Line_Kind::unknown, .tokens = std::pmr::vector<Token>(memory) });
        lex_line(lexed.tokens, source.substr(begin, end - begin), options);
        lexed.kind = classify_line(lexed.tokens);

        begin = end;
    }

    return result;
}

} // namespace mdlex::md
