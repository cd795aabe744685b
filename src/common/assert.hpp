#ifndef MDLEX_COMMON_ASSERT_HPP
#define MDLEX_COMMON_ASSERT_HPP

#include <cstdlib>
#include <source_location>
#include <string_view>

namespace mdlex {

enum struct Assertion_Error_Type { expression, unreachable };

/// @brief Raised when a precondition or internal invariant of the lexer is violated.
/// Malformed Markdown never raises this; only misuse of the API or a bug does.
struct Assertion_Error {
    Assertion_Error_Type type;
    std::string_view message;
    std::source_location location;
};

#ifdef __EXCEPTIONS
#define MDLEX_RAISE_ASSERTION_ERROR(...) (throw __VA_ARGS__)
#else
#define MDLEX_RAISE_ASSERTION_ERROR(...) ::std::exit(3)
#endif

// Expects an expression.
// If this expression (after contextual conversion to `bool`) is `false`,
// throws an `Assertion_Error` of type `expression`.
#define MDLEX_ASSERT(...)                                                                          \
    ((__VA_ARGS__) ? void()                                                                        \
                   : MDLEX_RAISE_ASSERTION_ERROR(::mdlex::Assertion_Error {                        \
                         ::mdlex::Assertion_Error_Type::expression, (#__VA_ARGS__),                \
                         ::std::source_location::current() }))

/// Expects a string literal.
/// Unconditionally throws `Assertion_Error` of type `unreachable`.
#define MDLEX_ASSERT_UNREACHABLE(...)                                                              \
    MDLEX_RAISE_ASSERTION_ERROR(::mdlex::Assertion_Error {                                         \
        ::mdlex::Assertion_Error_Type::unreachable, ::std::string_view(__VA_ARGS__),               \
        ::std::source_location::current() })

} // namespace mdlex

#endif
