#ifndef MDLEX_COMMON_UNICODE_HPP
#define MDLEX_COMMON_UNICODE_HPP

#include <string_view>

#include "common/config.hpp"

namespace mdlex {

/// @brief A decoded code point and the number of UTF-8 code units it occupies.
struct Code_Point {
    char32_t value;
    Size length;
};

/// @brief The code point substituted for malformed UTF-8.
inline constexpr char32_t replacement_character = U'\uFFFD';

/// @brief Decodes the UTF-8 code point which begins at the byte `offset` of `str`.
/// Malformed sequences decode as `replacement_character` with a length of one, so that
/// iterating with this function always makes progress.
/// @param str the UTF-8 text
/// @param offset a byte offset in range `[0, str.length())`
/// @return The code point and its encoded length in bytes.
[[nodiscard]] Code_Point decode_utf8(std::string_view str, Size offset) noexcept;

/// @brief Returns `true` if `c` has the Unicode `White_Space` property.
[[nodiscard]] constexpr bool is_unicode_whitespace(char32_t c) noexcept
{
    switch (c) {
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case U' ':
    case U'\x85':
    case U'\u00A0':
    case U'\u1680':
    case U'\u2028':
    case U'\u2029':
    case U'\u202F':
    case U'\u205F':
    case U'\u3000': return true;
    default: return c >= U'\u2000' && c <= U'\u200A';
    }
}

/// @brief Returns the number of bytes of leading whitespace in `str`.
[[nodiscard]] Size match_whitespace(std::string_view str) noexcept;

/// @brief Removes all leading Unicode whitespace.
[[nodiscard]] std::string_view trim_start(std::string_view str) noexcept;

/// @brief Removes all trailing Unicode whitespace.
[[nodiscard]] std::string_view trim_end(std::string_view str) noexcept;

/// @brief Removes all leading and trailing Unicode whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view str) noexcept
{
    return trim_end(trim_start(str));
}

} // namespace mdlex

#endif
