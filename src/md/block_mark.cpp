#include "common/parse.hpp"
#include "common/unicode.hpp"

#include "md/block_mark.hpp"
#include "md/token.hpp"

namespace mdlex::md {

namespace {

constexpr std::string_view code_fence = "```";
constexpr Size min_dividing_length = 3;

[[nodiscard]] bool is_title_mark(std::string_view word) noexcept
{
    return !word.empty() && word.length() <= 4
        && word.find_first_not_of('#') == std::string_view::npos;
}

// 1., 12., 123.
[[nodiscard]] bool is_ordered_mark(std::string_view word) noexcept
{
    if (word.length() < 2 || word.length() > 4 || !word.ends_with('.')) {
        return false;
    }
    const std::string_view number = word.substr(0, word.length() - 1);
    return number[0] != '0' && match_digits(number) == number.length();
}

[[nodiscard]] std::string_view strip_newline(std::string_view str) noexcept
{
    return str.ends_with('\n') ? str.substr(0, str.length() - 1) : str;
}

} // namespace

bool is_dividing_line(std::string_view line)
{
    char mark = 0;
    Size count = 0;
    for (Size i = 0; i < line.length();) {
        const Code_Point c = decode_utf8(line, i);
        i += c.length;
        if (is_unicode_whitespace(c.value)) {
            continue;
        }
        if (c.value != U'*' && c.value != U'-' && c.value != U'_') {
            return false;
        }
        if (count != 0 && char(c.value) != mark) {
            return false;
        }
        mark = char(c.value);
        ++count;
    }
    return count >= min_dividing_length;
}

std::optional<Token_Type> block_mark_type(std::string_view word, std::string_view line)
{
    if (is_title_mark(word)) {
        return Token_Type::title_mark;
    }
    if (is_ordered_mark(word)) {
        return Token_Type::ordered_mark;
    }
    if (word == ">") {
        return Token_Type::quote_mark;
    }
    if (word.starts_with(code_fence)) {
        return Token_Type::code_block_mark;
    }
    if (word == "+") {
        return Token_Type::unordered_mark;
    }
    if (word == "*" || word == "-") {
        return is_dividing_line(line) ? Token_Type::dividing_mark : Token_Type::unordered_mark;
    }
    if (word.starts_with('*') || word.starts_with('-') || word.starts_with('_')) {
        if (is_dividing_line(line)) {
            return Token_Type::dividing_mark;
        }
    }
    return std::nullopt;
}

std::optional<Size> lex_block_mark(std::pmr::vector<Token>& out, std::string_view line)
{
    std::pmr::memory_resource* const memory = out.get_allocator().resource();

    const Size indent = match_whitespace(line);
    if (indent == line.length()) {
        out.emplace_back(strip_newline(line), Token_Type::blank_line, memory);
        return std::nullopt;
    }

    Size word_end = indent;
    Size separator_length = 0;
    while (word_end < line.length()) {
        const Code_Point c = decode_utf8(line, word_end);
        if (is_unicode_whitespace(c.value)) {
            separator_length = c.length;
            break;
        }
        word_end += c.length;
    }
    const std::string_view word = line.substr(indent, word_end - indent);
    const std::optional<Token_Type> type = block_mark_type(word, line);

    if (type == Token_Type::dividing_mark) {
        out.emplace_back(strip_newline(line), Token_Type::dividing_mark, memory);
        return std::nullopt;
    }
    if (indent != 0) {
        out.emplace_back(line.substr(0, indent), Token_Type::white_space, memory);
    }
    if (!type) {
        return indent;
    }
    if (type == Token_Type::code_block_mark) {
        out.emplace_back(code_fence, Token_Type::code_block_mark, memory);
        return indent + code_fence.length();
    }
    out.emplace_back(word, *type, memory);
    // One separating whitespace character belongs to the mark.
    return word_end + separator_length;
}

} // namespace mdlex::md
