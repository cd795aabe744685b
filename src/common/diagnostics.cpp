#include <algorithm>
#include <ostream>
#include <string>

#include "common/ansi.hpp"
#include "common/diagnostics.hpp"

#include "md/lex.hpp"
#include "md/token.hpp"

namespace mdlex {

namespace {

[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type)
{
    using enum Code_Span_Type;
    switch (type) {
    case text: return ansi::reset;

    case whitespace: return ansi::h_black;

    case block_mark: return ansi::h_magenta;

    case emphasis_mark:
    case code_mark: return ansi::h_yellow;

    case link: return ansi::h_blue;

    case line_break: return ansi::h_cyan;

    case diagnostic_text:
    case diagnostic_code_citation:
    case diagnostic_punctuation: return ansi::reset;

    case diagnostic_code_position: return ansi::h_black;

    case diagnostic_error_text:
    case diagnostic_error: return ansi::h_red;

    case diagnostic_line_number: return ansi::h_yellow;

    case diagnostic_internal_error_notice: return ansi::h_yellow;

    case diagnostic_tag: return ansi::h_blue;

    case diagnostic_attribute: return ansi::h_magenta;

    case diagnostic_escape: return ansi::h_yellow;
    }
    MDLEX_ASSERT_UNREACHABLE("Unknown code span type.");
}

[[nodiscard]] Code_Span_Type code_span_type_of(md::Token_Type type)
{
    using enum md::Token_Type;
    switch (type) {
    case title_mark:
    case unordered_mark:
    case ordered_mark:
    case dividing_mark:
    case quote_mark:
    case code_block_mark: return Code_Span_Type::block_mark;

    case bold_mark:
    case italic_mark:
    case italic_bold_mark:
    case star:
    case underline: return Code_Span_Type::emphasis_mark;

    case code_mark:
    case back_tick: return Code_Span_Type::code_mark;

    case image:
    case link:
    case quick_link:
    case ref_link:
    case ref_link_def: return Code_Span_Type::link;

    case line_break: return Code_Span_Type::line_break;

    case blank_line:
    case white_space: return Code_Span_Type::whitespace;

    case text: return Code_Span_Type::text;
    }
    MDLEX_ASSERT_UNREACHABLE("Unknown token type.");
}

[[nodiscard]] std::string_view to_prose(IO_Error_Code e)
{
    using enum IO_Error_Code;
    switch (e) {
    case cannot_open: //
        return "Failed to open file.";
    case read_error: //
        return "I/O error occurred when reading from file.";
    }
    MDLEX_ASSERT_UNREACHABLE("invalid error code");
}

[[nodiscard]] std::string_view escape_sequence_of(char c)
{
    switch (c) {
    case '"': return "\\\"";
    case '\\': return "\\\\";
    case '\t': return "\\t";
    case '\n': return "\\n";
    case '\r': return "\\r";
    case '\v': return "\\v";
    case '\f': return "\\f";
    default: return {};
    }
}

/// @brief Appends `value` in double quotes, with quotes, backslashes and control characters
/// escaped.
void append_quoted(Code_String& out, std::string_view value, Code_Span_Type type)
{
    out.append('"', Code_Span_Type::diagnostic_punctuation);
    Size plain_begin = 0;
    for (Size i = 0; i < value.length(); ++i) {
        const std::string_view escape = escape_sequence_of(value[i]);
        if (escape.empty()) {
            continue;
        }
        if (plain_begin != i) {
            out.append(value.substr(plain_begin, i - plain_begin), type);
        }
        out.append(escape, Code_Span_Type::diagnostic_escape);
        plain_begin = i + 1;
    }
    if (plain_begin != value.length()) {
        out.append(value.substr(plain_begin), type);
    }
    out.append('"', Code_Span_Type::diagnostic_punctuation);
}

void append_padded_integer(Code_String& out, Size x, Size width, Code_Span_Type type)
{
    const Size length = std::to_string(x).length();
    out.append(width - std::min(length, width), ' ');
    out.append_integer(x, type);
}

constexpr md::Link_Attribute printed_attributes[] {
    md::Link_Attribute::name,
    md::Link_Attribute::location,
    md::Link_Attribute::title,
    md::Link_Attribute::reference,
};

} // namespace

void print_location_of_file(Code_String& out, std::string_view file)
{
    out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
}

void print_file_position(Code_String& out,
                         std::string_view file,
                         Size line,
                         Size column,
                         bool colon_suffix)
{
    auto builder = out.build(Code_Span_Type::diagnostic_code_position);
    builder.append(file).append(':').append_integer(line).append(':').append_integer(column);
    if (colon_suffix) {
        builder.append(':');
    }
}

void print_assertion_error(Code_String& out, const Assertion_Error& error)
{
    out.append("Assertion failed! ", Code_Span_Type::diagnostic_error);

    const std::string_view message = error.type == Assertion_Error_Type::expression
        ? "The following expression evaluated to 'false', but was expected to be 'true':"
        : "Code which must be unreachable has been reached.";
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append("\n\n");

    print_file_position(out, error.location.file_name(), error.location.line(),
                        error.location.column());
    out.append(' ');
    out.append(error.message, Code_Span_Type::diagnostic_error_text);
    out.append("\n\n");
    print_internal_error_notice(out);
}

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(to_prose(error), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_tokens(Code_String& out,
                  std::span<const md::Token> tokens,
                  Size line,
                  Token_Print_Options options)
{
    for (Size i = 0; i < tokens.size(); ++i) {
        const md::Token& token = tokens[i];

        append_padded_integer(out, line + 1, options.position_width,
                              Code_Span_Type::diagnostic_line_number);
        out.append(':', Code_Span_Type::diagnostic_punctuation);
        append_padded_integer(out, i, options.position_width,
                              Code_Span_Type::diagnostic_code_position);
        out.append(':', Code_Span_Type::diagnostic_punctuation);
        out.append(' ');
        out.append(md::token_type_name(token.type), Code_Span_Type::diagnostic_tag);
        out.append(' ');
        append_quoted(out, token.value, code_span_type_of(token.type));

        if (options.print_attributes && md::is_link(token.type)) {
            for (const md::Link_Attribute attribute : printed_attributes) {
                if (const std::optional<std::string_view> value = token.attribute(attribute)) {
                    out.append(' ');
                    out.append(md::link_attribute_name(attribute),
                               Code_Span_Type::diagnostic_attribute);
                    out.append('=', Code_Span_Type::diagnostic_punctuation);
                    append_quoted(out, *value, Code_Span_Type::diagnostic_code_citation);
                }
            }
        }
        out.append('\n');
    }
}

void print_lines(Code_String& out,
                 std::span<const md::Lexed_Line> lines,
                 Token_Print_Options options)
{
    for (const md::Lexed_Line& line : lines) {
        append_padded_integer(out, line.line + 1, options.position_width,
                              Code_Span_Type::diagnostic_line_number);
        out.append(':', Code_Span_Type::diagnostic_punctuation);
        out.append(' ');
        out.append(md::line_kind_name(line.kind), Code_Span_Type::diagnostic_tag);
        out.append(' ');

        auto builder = out.build(Code_Span_Type::diagnostic_text);
        builder.append('(').append_integer(line.tokens.size());
        builder.append(line.tokens.size() == 1 ? " token)" : " tokens)");
        builder.append('\n');
    }
}

void print_internal_error_notice(Code_String& out)
{
    constexpr std::string_view notice
        = "This is an internal error of the lexer. Please report it together with the input "
          "that caused it.\n";
    out.append(notice, Code_Span_Type::diagnostic_internal_error_notice);
}

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors)
{
    const std::string_view text = string.get_text();
    if (!colors) {
        return out << text;
    }

    Code_String_Span previous {};
    for (Code_String_Span span : string) {
        const Size previous_end = previous.end();
        MDLEX_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            out << text.substr(previous_end, span.begin - previous_end);
        }
        out << highlight_color_of(span.type) << text.substr(span.begin, span.length) << ansi::reset;
        previous = span;
    }
    const Size last_span_end = previous.end();
    if (last_span_end != text.size()) {
        out << text.substr(last_span_end);
    }

    return out;
}

} // namespace mdlex
