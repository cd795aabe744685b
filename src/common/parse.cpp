#include "common/parse.hpp"

namespace mdlex {

std::optional<Text_Match> match_quoted_string(std::string_view s, char quote) noexcept
{
    if (!s.starts_with(quote)) {
        return {};
    }
    bool escaped = false;
    for (Size i = 1; i < s.size(); ++i) {
        if (escaped) {
            escaped = false;
        }
        else if (s[i] == '\\') {
            escaped = true;
        }
        else if (s[i] == quote) {
            return Text_Match { .length = i + 1, .is_terminated = true };
        }
    }
    return Text_Match { .length = s.length(), .is_terminated = false };
}

bool is_quoted_string(std::string_view s) noexcept
{
    for (const char quote : { '"', '\'' }) {
        if (const std::optional<Text_Match> m = match_quoted_string(s, quote)) {
            return m->is_terminated && m->length == s.length();
        }
    }
    return false;
}

Size match_uri_scheme(std::string_view str) noexcept
{
    if (str.empty() || !is_ascii_alpha(str[0])) {
        return 0;
    }
    Size length = 1;
    while (length < str.length()) {
        const char c = str[length];
        if (!is_ascii_alphanumeric(c) && c != '+' && c != '-' && c != '.') {
            break;
        }
        ++length;
    }
    return length;
}

} // namespace mdlex
