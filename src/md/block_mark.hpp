#ifndef MDLEX_MD_BLOCK_MARK_HPP
#define MDLEX_MD_BLOCK_MARK_HPP

#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include "common/config.hpp"

#include "md/fwd.hpp"

namespace mdlex::md {

/// @brief Returns `true` if `line`, ignoring all whitespace, consists of at least three
/// occurrences of the same character, which is one of `*`, `-`, or `_`.
/// For example, `---`, `* * *`, and `__ ____` are dividing lines, but `*-*` is not.
[[nodiscard]] bool is_dividing_line(std::string_view line);

/// @brief Returns the type of block mark that `word` represents, if any.
/// @param word the first whitespace-delimited word of `line`
/// @param line the whole line, which is needed to tell dividing lines from list items
[[nodiscard]] std::optional<Token_Type> block_mark_type(std::string_view word,
                                                        std::string_view line);

/// @brief Lexes the leading part of a line, consisting of indentation and the block mark.
/// Appends at most one `white_space` token and at most one block mark or `blank_line` to `out`.
/// @param out the vector to which tokens are appended
/// @param line the line, possibly ending in a newline
/// @return The offset in `line` where inline content begins, or `std::nullopt` if the whole line
/// has been consumed, which is the case for blank lines and dividing lines.
[[nodiscard]] std::optional<Size> lex_block_mark(std::pmr::vector<Token>& out,
                                                 std::string_view line);

} // namespace mdlex::md

#endif
