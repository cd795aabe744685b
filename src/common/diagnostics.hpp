#ifndef MDLEX_COMMON_DIAGNOSTICS_HPP
#define MDLEX_COMMON_DIAGNOSTICS_HPP

#include <iosfwd>
#include <span>
#include <string_view>

#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/io.hpp"

#include "md/fwd.hpp"

namespace mdlex {

/// @brief Prints the location of the file nicely formatted.
/// @param out the string to write to
/// @param file the file
void print_location_of_file(Code_String& out, std::string_view file);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// @param out the string to write to
/// @param file the file
/// @param line the one-based line
/// @param column the one-based column
/// @param colon_suffix if `true`, appends a `:` to the string as part of the same span
void print_file_position(Code_String& out,
                         std::string_view file,
                         Size line,
                         Size column,
                         bool colon_suffix = true);

void print_assertion_error(Code_String& out, const Assertion_Error& error);

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error);

struct Token_Print_Options {
    /// @brief If `true`, the attributes of link tokens are printed after the token value.
    bool print_attributes = true;
    /// @brief The minimum width of line numbers and token indices.
    Size position_width = 2;
};

/// @brief Prints one line per token, consisting of the position, the type, the quoted value,
/// and the attributes, if any.
/// @param out the string to write to
/// @param tokens the tokens of a single line
/// @param line the zero-based line number
void print_tokens(Code_String& out,
                  std::span<const md::Token> tokens,
                  Size line = 0,
                  Token_Print_Options options = {});

/// @brief Prints one line per lexed line, consisting of the line number, the kind, and the
/// amount of tokens.
void print_lines(Code_String& out,
                 std::span<const md::Lexed_Line> lines,
                 Token_Print_Options options = {});

void print_internal_error_notice(Code_String& out);

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors);

} // namespace mdlex

#endif
