#include "common/unicode.hpp"

namespace mdlex {

namespace {

[[nodiscard]] constexpr bool is_continuation(unsigned char c) noexcept
{
    return (c & 0b1100'0000) == 0b1000'0000;
}

} // namespace

Code_Point decode_utf8(std::string_view str, Size offset) noexcept
{
    const auto lead = static_cast<unsigned char>(str[offset]);
    if (lead < 0x80) {
        return { lead, 1 };
    }

    Size length;
    char32_t value;
    if ((lead & 0b1110'0000) == 0b1100'0000) {
        length = 2;
        value = lead & 0b0001'1111;
    }
    else if ((lead & 0b1111'0000) == 0b1110'0000) {
        length = 3;
        value = lead & 0b0000'1111;
    }
    else if ((lead & 0b1111'1000) == 0b1111'0000) {
        length = 4;
        value = lead & 0b0000'0111;
    }
    else {
        return { replacement_character, 1 };
    }

    if (offset + length > str.length()) {
        return { replacement_character, 1 };
    }
    for (Size i = 1; i < length; ++i) {
        const auto c = static_cast<unsigned char>(str[offset + i]);
        if (!is_continuation(c)) {
            return { replacement_character, 1 };
        }
        value = (value << 6) | (c & 0b0011'1111);
    }
    return { value, length };
}

Size match_whitespace(std::string_view str) noexcept
{
    Size i = 0;
    while (i < str.length()) {
        const Code_Point c = decode_utf8(str, i);
        if (!is_unicode_whitespace(c.value)) {
            break;
        }
        i += c.length;
    }
    return i;
}

std::string_view trim_start(std::string_view str) noexcept
{
    return str.substr(match_whitespace(str));
}

std::string_view trim_end(std::string_view str) noexcept
{
    // Decoding backwards is ambiguous for malformed input, so scan forwards and remember where
    // the last non-whitespace code point ended.
    Size end = 0;
    for (Size i = 0; i < str.length();) {
        const Code_Point c = decode_utf8(str, i);
        i += c.length;
        if (!is_unicode_whitespace(c.value)) {
            end = i;
        }
    }
    return str.substr(0, end);
}

} // namespace mdlex
