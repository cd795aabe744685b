#ifndef MDLEX_MD_INLINE_HPP
#define MDLEX_MD_INLINE_HPP

#include <memory_resource>
#include <string_view>
#include <vector>

#include "md/fwd.hpp"

namespace mdlex::md {

/// @brief The characters which lose their special meaning when preceded by a backslash.
inline constexpr std::string_view escapable_characters = ":*_`#+-.![]()<>\\";

/// @brief Returns `true` if the inline content requests a hard line break, i.e. if it ends with
/// two spaces and a newline, or if it ends with `<br>`, ignoring trailing whitespace.
[[nodiscard]] bool has_line_break(std::string_view content);

/// @brief Tokenizes the inline content of a line, i.e. everything following the block mark.
/// Tokens are appended to `out`, with emphasis and code delimiters already resolved
/// (see `tidy`).
/// Tokenization stops at the first newline, or at the end of `content`.
/// @param out the vector to which tokens are appended; the tokens allocate from its resource
/// @param content the inline content
/// @param validator decides which autolinks are accepted
void tokenize_inline(std::pmr::vector<Token>& out,
                     std::string_view content,
                     const Link_Validator& validator);

} // namespace mdlex::md

#endif
