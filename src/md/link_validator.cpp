#include <array>

#include "common/parse.hpp"
#include "common/unicode.hpp"

#include "md/link_validator.hpp"

namespace mdlex::md {

namespace {

constexpr Size max_email_local_length = 64;
constexpr Size max_email_domain_length = 255;
constexpr Size max_domain_label_length = 63;

constexpr std::array<std::string_view, 5> authority_schemes { "http", "https", "ftp", "ws",
                                                              "wss" };

[[nodiscard]] bool equals_ignore_case(std::string_view a, std::string_view b) noexcept
{
    if (a.length() != b.length()) {
        return false;
    }
    for (Size i = 0; i < a.length(); ++i) {
        const char x = a[i] >= 'A' && a[i] <= 'Z' ? char(a[i] - 'A' + 'a') : a[i];
        const char y = b[i] >= 'A' && b[i] <= 'Z' ? char(b[i] - 'A' + 'a') : b[i];
        if (x != y) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool is_authority_scheme(std::string_view scheme) noexcept
{
    for (const std::string_view s : authority_schemes) {
        if (equals_ignore_case(scheme, s)) {
            return true;
        }
    }
    return false;
}

/// @brief Returns `true` if `str` contains no character which may never appear in a URL.
[[nodiscard]] bool is_url_text(std::string_view str) noexcept
{
    for (Size i = 0; i < str.length();) {
        const Code_Point p = decode_utf8(str, i);
        if (p.value < 0x80 && is_ascii_control(char(p.value))) {
            return false;
        }
        if (is_unicode_whitespace(p.value) || p.value == U'<' || p.value == U'>') {
            return false;
        }
        i += p.length;
    }
    return true;
}

// reg-name = *( unreserved / pct-encoded / sub-delims ), where non-ASCII is accepted as-is.
[[nodiscard]] bool is_registered_name(std::string_view host) noexcept
{
    for (Size i = 0; i < host.length(); ++i) {
        const char c = host[i];
        if (c == '%') {
            if (i + 2 >= host.length() || !is_hexadecimal_digit(host[i + 1])
                || !is_hexadecimal_digit(host[i + 2])) {
                return false;
            }
            i += 2;
        }
        else if (!is_uri_unreserved(c) && !is_uri_sub_delimiter(c) && !is_non_ascii(c)) {
            return false;
        }
    }
    return true;
}

// IP-literal = "[" ( IPv6address / IPvFuture ) "]", checked only for its alphabet.
[[nodiscard]] bool is_ip_literal(std::string_view host) noexcept
{
    if (host.length() < 3 || !host.starts_with('[') || !host.ends_with(']')) {
        return false;
    }
    for (const char c : host.substr(1, host.length() - 2)) {
        if (!is_hexadecimal_digit(c) && c != ':' && c != '.' && c != 'v' && c != 'V') {
            return false;
        }
    }
    return true;
}

/// @brief Validates `[ userinfo "@" ] host [ ":" port ]`.
[[nodiscard]] bool is_authority(std::string_view authority, bool allow_empty_host) noexcept
{
    if (const Size at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (authority.starts_with('[')) {
        const Size close = authority.find(']');
        if (close == std::string_view::npos) {
            return false;
        }
        host = authority.substr(0, close + 1);
        port = authority.substr(close + 1);
    }
    else if (const Size colon = authority.find(':'); colon != std::string_view::npos) {
        host = authority.substr(0, colon);
        port = authority.substr(colon);
    }

    if (!port.empty()) {
        if (port[0] != ':' || match_digits(port.substr(1)) != port.length() - 1) {
            return false;
        }
    }
    if (host.empty()) {
        return allow_empty_host && port.empty();
    }
    return host.starts_with('[') ? is_ip_literal(host) : is_registered_name(host);
}

[[nodiscard]] bool is_atext(char c) noexcept
{
    return is_ascii_alphanumeric(c) || is_non_ascii(c)
        || std::string_view { "!#$%&'*+/=?^_`{|}~-" }.find(c) != std::string_view::npos;
}

[[nodiscard]] bool is_dot_atom(std::string_view str) noexcept
{
    if (str.empty() || str.starts_with('.') || str.ends_with('.')) {
        return false;
    }
    char previous = 0;
    for (const char c : str) {
        if (c == '.') {
            if (previous == '.') {
                return false;
            }
        }
        else if (!is_atext(c)) {
            return false;
        }
        previous = c;
    }
    return true;
}

[[nodiscard]] bool is_email_local_part(std::string_view local) noexcept
{
    if (local.empty() || local.length() > max_email_local_length) {
        return false;
    }
    if (local.starts_with('"')) {
        const std::optional<Text_Match> m = match_quoted_string(local, '"');
        return m && m->is_terminated && m->length == local.length();
    }
    return is_dot_atom(local);
}

[[nodiscard]] bool is_domain_label(std::string_view label) noexcept
{
    if (label.empty() || label.length() > max_domain_label_length) {
        return false;
    }
    if (label.starts_with('-') || label.ends_with('-')) {
        return false;
    }
    for (const char c : label) {
        if (!is_ascii_alphanumeric(c) && !is_non_ascii(c) && c != '-') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool is_domain_literal(std::string_view domain) noexcept
{
    if (domain.length() < 3 || !domain.starts_with('[') || !domain.ends_with(']')) {
        return false;
    }
    for (const char c : domain.substr(1, domain.length() - 2)) {
        if (c == '[' || c == ']' || c == '\\' || c == ' ' || is_ascii_control(c)) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool is_email_domain(std::string_view domain) noexcept
{
    if (domain.empty() || domain.length() > max_email_domain_length) {
        return false;
    }
    if (domain.starts_with('[')) {
        return is_domain_literal(domain);
    }
    while (true) {
        const Size dot = domain.find('.');
        if (!is_domain_label(domain.substr(0, dot))) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        domain.remove_prefix(dot + 1);
    }
}

} // namespace

bool Syntax_Link_Validator::is_url(std::string_view str) const
{
    const Size scheme_length = match_uri_scheme(str);
    if (scheme_length == 0 || scheme_length >= str.length() || str[scheme_length] != ':') {
        return false;
    }
    if (!is_url_text(str)) {
        return false;
    }

    const std::string_view scheme = str.substr(0, scheme_length);
    const std::string_view rest = str.substr(scheme_length + 1);
    const bool is_file = equals_ignore_case(scheme, "file");
    if (!is_file && !is_authority_scheme(scheme)) {
        return true;
    }
    if (!rest.starts_with("//")) {
        return is_file;
    }
    const std::string_view hierarchy = rest.substr(2);
    const std::string_view authority = hierarchy.substr(0, hierarchy.find_first_of("/?#"));
    return is_authority(authority, is_file);
}

bool Syntax_Link_Validator::is_email(std::string_view str) const
{
    const Size at = str.rfind('@');
    if (at == std::string_view::npos) {
        return false;
    }
    return is_email_local_part(str.substr(0, at)) && is_email_domain(str.substr(at + 1));
}

const Link_Validator& default_link_validator() noexcept
{
    static const Syntax_Link_Validator instance {};
    return instance;
}

} // namespace mdlex::md
