#ifndef MDLEX_COMMON_CODE_SPAN_TYPE_HPP
#define MDLEX_COMMON_CODE_SPAN_TYPE_HPP

#include "common/config.hpp"

namespace mdlex {

/// @brief The type of a span in a highlighted `Code_String`.
/// Markdown tokens fall into the first handful of categories for the purpose of highlighting;
/// the rest is used for diagnostics.
enum struct Code_Span_Type : Default_Underlying {
    text,
    whitespace,
    block_mark,
    emphasis_mark,
    code_mark,
    link,
    line_break,
    diagnostic_text,
    diagnostic_error_text,
    diagnostic_code_position,
    diagnostic_error,
    diagnostic_line_number,
    diagnostic_punctuation,
    diagnostic_code_citation,
    diagnostic_internal_error_notice,
    diagnostic_tag,
    diagnostic_attribute,
    diagnostic_escape,
};

} // namespace mdlex

#endif
