#ifndef MDLEX_MD_LINK_VALIDATOR_HPP
#define MDLEX_MD_LINK_VALIDATOR_HPP

#include <string_view>

#include "md/fwd.hpp"

namespace mdlex::md {

/// @brief Decides whether the content of an autolink such as `<https://example.com>` is a link.
/// The lexer only consults the validator for autolinks; locations of inline links and reference
/// definitions are taken verbatim.
struct Link_Validator {
    // The lack of virtual destructor is intentional; we don't ever own this polymorphically.

    /// @brief Returns `true` if `str` is an absolute URL.
    [[nodiscard]] virtual bool is_url(std::string_view str) const = 0;

    /// @brief Returns `true` if `str` is an email address.
    [[nodiscard]] virtual bool is_email(std::string_view str) const = 0;

    /// @brief Equivalent to: `is_url(str) || is_email(str)`
    [[nodiscard]] bool is_autolink(std::string_view str) const
    {
        return is_url(str) || is_email(str);
    }
};

/// @brief A `Link_Validator` which performs purely syntactic checks.
///
/// URLs consist of a scheme, a colon, and a remainder without whitespace, control characters,
/// `<`, or `>`.
/// The schemes `http`, `https`, `ftp`, `ws`, and `wss` additionally require `//` followed by a
/// non-empty host, optionally preceded by user information and followed by a numeric port.
/// For `file`, the host may be empty.
///
/// Email addresses consist of a dot-atom or quoted local part of at most 64 bytes, `@`, and a
/// domain of at most 255 bytes, which is either a bracketed literal or a sequence of
/// dot-separated labels.
struct Syntax_Link_Validator final : Link_Validator {
    [[nodiscard]] bool is_url(std::string_view str) const final;
    [[nodiscard]] bool is_email(std::string_view str) const final;
};

/// @brief Returns the validator used by the lexer when no other validator is specified.
/// The returned object has no state, so it can be shared by any number of threads.
[[nodiscard]] const Link_Validator& default_link_validator() noexcept;

} // namespace mdlex::md

#endif
