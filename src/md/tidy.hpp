#ifndef MDLEX_MD_TIDY_HPP
#define MDLEX_MD_TIDY_HPP

#include <memory_resource>
#include <vector>

#include "md/token.hpp"

namespace mdlex::md {

/// @brief Splits runs of the given delimiter type so that a run can close a shorter run that
/// precedes it.
/// For example, the runs `**` and `***` are turned into `**`, `**`, and `*`.
/// @param type `Token_Type::star` or `Token_Type::underline`
void normalize_runs(std::pmr::vector<Token>& tokens, Token_Type type);

/// @brief Pairs raw delimiters into emphasis and code marks.
/// A delimiter is closed by the nearest preceding open delimiter with the same type and value.
/// Delimiters that remain unpaired, as well as open delimiters skipped over by a match,
/// become `text`.
/// Postcondition: no token in `tokens` is a raw delimiter (see `is_raw_delimiter`).
void resolve_delimiters(std::pmr::vector<Token>& tokens);

/// @brief Equivalent to normalizing `star` and `underline` runs and then resolving delimiters.
void tidy(std::pmr::vector<Token>& tokens);

} // namespace mdlex::md

#endif
