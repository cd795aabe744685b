#ifndef MDLEX_COMMON_VISIT_HPP
#define MDLEX_COMMON_VISIT_HPP

#include <type_traits>
#include <variant>

#include "common/assert.hpp"
#include "common/config.hpp"

/*
This header contains a drop-in replacement for std::visit, used by the per-character state
machine of the inline lexer.
The visitor is invoked once for every character of a line, so we want something which is
guaranteed to be as fast as a simple switch statement and which adds no stack frames.
Overloads exist only for the variant sizes in use.
*/

namespace mdlex {

namespace detail {

template <typename T>
inline constexpr Size variant_like_size_v
    = decltype([]<typename... Ts>(std::variant<Ts...>&)
                   -> std::integral_constant<std::size_t, sizeof...(Ts)> {}(
                       std::declval<T&>()))::value;

} // namespace detail

#define MDLEX_VISIT_CASE(...)                                                                      \
    case __VA_ARGS__: return static_cast<F&&>(f)(::std::get<__VA_ARGS__>(static_cast<V&&>(v)))

template <typename F, typename V>
constexpr decltype(auto) fast_visit(F&& f, V&& v) = delete;

template <typename F, typename V>
    requires(detail::variant_like_size_v<std::remove_cvref_t<V>> == 12)
constexpr decltype(auto) fast_visit(F&& f, V&& v)
{
    if (v.valueless_by_exception()) {
        throw std::bad_variant_access();
    }
    switch (v.index()) {
        MDLEX_VISIT_CASE(0);
        MDLEX_VISIT_CASE(1);
        MDLEX_VISIT_CASE(2);
        MDLEX_VISIT_CASE(3);
        MDLEX_VISIT_CASE(4);
        MDLEX_VISIT_CASE(5);
        MDLEX_VISIT_CASE(6);
        MDLEX_VISIT_CASE(7);
        MDLEX_VISIT_CASE(8);
        MDLEX_VISIT_CASE(9);
        MDLEX_VISIT_CASE(10);
        MDLEX_VISIT_CASE(11);
    }
    MDLEX_ASSERT_UNREACHABLE("impossible variant index");
}

} // namespace mdlex

#endif
