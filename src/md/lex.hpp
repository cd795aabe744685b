#ifndef MDLEX_MD_LEX_HPP
#define MDLEX_MD_LEX_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "common/assert.hpp"
#include "common/config.hpp"

#include "md/fwd.hpp"
#include "md/link_validator.hpp"
#include "md/token.hpp"

namespace mdlex::md {

struct Lex_Options {
    /// @brief Decides which autolinks are accepted. Shall not be null.
    const Link_Validator* validator = &default_link_validator();
};

/// @brief The kind of a line, determined by its first significant token.
enum struct Line_Kind : Default_Underlying {
    /// @brief An empty token sequence, a code fence, or a dividing line.
    unknown,
    blank,
    title,
    list_item,
    quote,
    /// @brief A line without a block mark.
    plain,
};

[[nodiscard]] constexpr std::string_view line_kind_name(Line_Kind kind)
{
    using enum Line_Kind;
    switch (kind) {
        MDLEX_ENUM_STRING_CASE(unknown);
        MDLEX_ENUM_STRING_CASE(blank);
        MDLEX_ENUM_STRING_CASE(title);
        MDLEX_ENUM_STRING_CASE(list_item);
        MDLEX_ENUM_STRING_CASE(quote);
        MDLEX_ENUM_STRING_CASE(plain);
    }
    MDLEX_ASSERT_UNREACHABLE("Unknown line kind.");
}

/// @brief A line of a document together with its tokens.
struct Lexed_Line {
    /// @brief The zero-based line number.
    Size line;
    Line_Kind kind;
    std::pmr::vector<Token> tokens;
};

/// @brief Lexes a single line of Markdown.
/// Lexing never fails; constructs which are not well-formed are lexed as `text`.
/// @param out the vector to which tokens are appended; tokens allocate from its resource
/// @param line the line, which may only contain a newline as its last character
/// @param options the options
void lex_line(std::pmr::vector<Token>& out, std::string_view line, const Lex_Options& options = {});

/// @brief Lexes a single line of Markdown with default options.
/// @param line the line, which may only contain a newline as its last character
/// @param memory the memory resource of the returned vector and its tokens
[[nodiscard]] std::pmr::vector<Token>
lex_line(std::string_view line,
         std::pmr::memory_resource* memory = std::pmr::get_default_resource());

/// @brief Determines the kind of a line from its tokens, ignoring leading indentation.
[[nodiscard]] Line_Kind classify_line(std::span<const Token> tokens);

/// @brief Splits `source` into lines and lexes each of them independently.
/// Every line keeps its terminating newline. A final newline does not begin another line.
[[nodiscard]] std::pmr::vector<Lexed_Line>
lex_lines(std::string_view source,
          const Lex_Options& options = {},
          std::pmr::memory_resource* memory = std::pmr::get_default_resource());

} // namespace mdlex::md

#endif
