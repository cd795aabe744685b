#ifndef MDLEX_COMMON_PARSE_HPP
#define MDLEX_COMMON_PARSE_HPP

#include <algorithm>
#include <optional>
#include <string_view>

#include "common/config.hpp"

namespace mdlex {

struct Text_Match {
    Size length;
    bool is_terminated;
};

/// @brief Returns `true` if the given character is a decimal digit (`0` through `9`).
[[nodiscard]] constexpr bool is_decimal_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Returns `true` if the given character is a hexadecimal digit in either case.
[[nodiscard]] constexpr bool is_hexadecimal_digit(char c) noexcept
{
    return is_decimal_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/// @brief Returns `true` if the given character is a latin letter in either case.
[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

[[nodiscard]] constexpr bool is_ascii_alphanumeric(char c) noexcept
{
    return is_ascii_alpha(c) || is_decimal_digit(c);
}

/// @brief Returns `true` if `c` is the first byte of a multi-byte UTF-8 sequence
/// or a continuation byte.
[[nodiscard]] constexpr bool is_non_ascii(char c) noexcept
{
    return static_cast<unsigned char>(c) >= 0x80;
}

/// @brief Returns `true` for ASCII control characters, including DEL.
[[nodiscard]] constexpr bool is_ascii_control(char c) noexcept
{
    const auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7f;
}

/// @brief Matches as many decimal digits as possible.
/// @param str the string with digits at the beginning
/// @return The number of leading digits.
[[nodiscard]] inline Size match_digits(std::string_view str) noexcept
{
    return std::min(str.find_first_not_of("0123456789"), str.size());
}

/// @brief Matches a string which is delimited by `quote` on both ends.
/// Within the string, a backslash escapes the following character, so `"a\"b"` is one string.
/// @param str the string, possibly beginning with `quote`
/// @param quote the delimiting character, typically `"` or `'`
/// @return `std::nullopt` if `str` does not begin with `quote`, otherwise the match.
/// If the string is not terminated, `length` is the length of `str`.
[[nodiscard]] std::optional<Text_Match> match_quoted_string(std::string_view str,
                                                            char quote) noexcept;

/// @brief Returns `true` if the whole of `str` is exactly one single-quoted or one
/// double-quoted string, as matched by `match_quoted_string`.
[[nodiscard]] bool is_quoted_string(std::string_view str) noexcept;

/// @brief Matches a URI scheme as defined in RFC 3986,
/// i.e. `ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )`.
/// The scheme does not include the following colon.
/// @param str the string, possibly starting with a scheme
/// @return The length of the scheme, or zero if there is none.
[[nodiscard]] Size match_uri_scheme(std::string_view str) noexcept;

/// @brief Returns `true` if `c` is a `sub-delims` character of RFC 3986.
[[nodiscard]] constexpr bool is_uri_sub_delimiter(char c) noexcept
{
    return std::string_view { "!$&'()*+,;=" }.find(c) != std::string_view::npos;
}

/// @brief Returns `true` if `c` is an `unreserved` character of RFC 3986.
[[nodiscard]] constexpr bool is_uri_unreserved(char c) noexcept
{
    return is_ascii_alphanumeric(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

} // namespace mdlex

#endif
