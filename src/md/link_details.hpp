#ifndef MDLEX_MD_LINK_DETAILS_HPP
#define MDLEX_MD_LINK_DETAILS_HPP

#include <memory_resource>
#include <string_view>

#include "md/token.hpp"

namespace mdlex::md {

/// @brief The location and title of a link clause such as `/a.png "A"`.
struct Link_Destination {
    std::string_view location;
    /// @brief The title without its enclosing quotes, or empty.
    std::string_view title;
};

/// @brief Splits a link clause into location and title.
/// The clause is trimmed and split at its first run of spaces or tabs.
/// If there are two fields, the second one must be a quoted string in `"` or `'`.
/// @param clause the text in parentheses of an inline link, or following the colon of a
/// reference definition
/// @return The destination, or `std::nullopt` if the second field is not a quoted string.
[[nodiscard]] std::optional<Link_Destination> split_link_clause(std::string_view clause);

/// @brief Creates a link-family token with its attributes.
///
/// - For `image` and `link`, `name` is the bracketed text and `clause` is the parenthesized text.
/// - For `ref_link_def`, `name` is the reference tag and `clause` the text after the colon.
/// - For `ref_link`, `name` is the bracketed text and `clause` is the reference tag, which is
///   stored trimmed.
/// - For `quick_link`, `clause` is the validated link, stored as both name and location.
///
/// If the clause of an `image`, `link`, or `ref_link_def` cannot be split
/// (see `split_link_clause`), the result is a `text` token with the given value and no
/// attributes.
/// @param value the full text of the token, e.g. `[a](b)`
[[nodiscard]] Token make_link_token(std::string_view value,
                                    std::string_view name,
                                    std::string_view clause,
                                    Token_Type type,
                                    std::pmr::memory_resource* memory);

} // namespace mdlex::md

#endif
