#ifndef MDLEX_MD_TOKEN_TYPE_HPP
#define MDLEX_MD_TOKEN_TYPE_HPP

#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

#include "md/fwd.hpp"

namespace mdlex::md {

enum struct Token_Type : Default_Underlying {
    // #, ##, ###, ####
    title_mark,
    // *, -, +
    unordered_mark,
    // 1., 12., 123.
    ordered_mark,
    // ---, ***, ___, * * *
    dividing_mark,
    // >
    quote_mark,
    // ```
    code_block_mark,
    // ** **
    bold_mark,
    // * *
    italic_mark,
    // *** ***
    italic_bold_mark,
    // ` `
    code_mark,
    // whitespace-only line
    blank_line,
    // <br>, or two trailing spaces
    line_break,
    // ![name](location "title")
    image,
    // [name](location "title")
    link,
    // <url-or-email>
    quick_link,
    // [name][tag]
    ref_link,
    // [tag]: location "title"
    ref_link_def,
    // anything else
    text,
    // run of *, only before resolution
    star,
    // run of _, only before resolution
    underline,
    // run of `, only before resolution
    back_tick,
    // indentation of a line
    white_space,
};

[[nodiscard]] constexpr std::string_view token_type_name(Token_Type type)
{
    using enum Token_Type;
    switch (type) {
        MDLEX_ENUM_STRING_CASE(title_mark);
        MDLEX_ENUM_STRING_CASE(unordered_mark);
        MDLEX_ENUM_STRING_CASE(ordered_mark);
        MDLEX_ENUM_STRING_CASE(dividing_mark);
        MDLEX_ENUM_STRING_CASE(quote_mark);
        MDLEX_ENUM_STRING_CASE(code_block_mark);
        MDLEX_ENUM_STRING_CASE(bold_mark);
        MDLEX_ENUM_STRING_CASE(italic_mark);
        MDLEX_ENUM_STRING_CASE(italic_bold_mark);
        MDLEX_ENUM_STRING_CASE(code_mark);
        MDLEX_ENUM_STRING_CASE(blank_line);
        MDLEX_ENUM_STRING_CASE(line_break);
        MDLEX_ENUM_STRING_CASE(image);
        MDLEX_ENUM_STRING_CASE(link);
        MDLEX_ENUM_STRING_CASE(quick_link);
        MDLEX_ENUM_STRING_CASE(ref_link);
        MDLEX_ENUM_STRING_CASE(ref_link_def);
        MDLEX_ENUM_STRING_CASE(text);
        MDLEX_ENUM_STRING_CASE(star);
        MDLEX_ENUM_STRING_CASE(underline);
        MDLEX_ENUM_STRING_CASE(back_tick);
        MDLEX_ENUM_STRING_CASE(white_space);
    }
    MDLEX_ASSERT_UNREACHABLE("Unknown token type.");
}

/// @brief Returns `true` for the types which can only appear as the first significant token of
/// a line.
[[nodiscard]] constexpr bool is_block_mark(Token_Type type) noexcept
{
    using enum Token_Type;
    return type == title_mark || type == unordered_mark || type == ordered_mark
        || type == dividing_mark || type == quote_mark || type == code_block_mark;
}

/// @brief Returns `true` for the link family, i.e. the types whose tokens may carry
/// `Link_Attribute`s.
[[nodiscard]] constexpr bool is_link(Token_Type type) noexcept
{
    using enum Token_Type;
    return type == image || type == link || type == quick_link || type == ref_link
        || type == ref_link_def;
}

/// @brief Returns `true` for the unresolved delimiter runs produced by the inline automaton.
/// No token of such a type survives `tidy`.
[[nodiscard]] constexpr bool is_raw_delimiter(Token_Type type) noexcept
{
    using enum Token_Type;
    return type == star || type == underline || type == back_tick;
}

} // namespace mdlex::md

#endif
