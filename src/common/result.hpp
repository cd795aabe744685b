#ifndef MDLEX_COMMON_RESULT_HPP
#define MDLEX_COMMON_RESULT_HPP

#include <memory>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace mdlex {

struct Bad_Result_Access : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Error_Tag { };
struct Success_Tag { };

/// @brief Either a value of type `T`, or an `Error`.
/// Used for failures that come from the environment (files, streams), never for malformed
/// Markdown, which the lexer always accepts.
template <typename T, typename Error>
struct Result {
private:
    union {
        T m_value;
        Error m_error;
    };
    bool m_has_value;

public:
    [[nodiscard]] constexpr Result(Success_Tag,
                                   T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires std::is_move_constructible_v<T>
        : m_value(std::move(value))
        , m_has_value(true)
    {
    }

    [[nodiscard]] constexpr Result(Error_Tag, const Error& error) noexcept(
        std::is_nothrow_copy_constructible_v<Error>)
        requires std::is_copy_constructible_v<Error>
        : m_error(error)
        , m_has_value(false)
    {
    }

    [[nodiscard]] constexpr Result(Result&& other) noexcept(
        std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<Error>)
        requires(std::is_move_constructible_v<T> && std::is_move_constructible_v<Error>)
        : m_has_value(other.m_has_value)
    {
        if (other.m_has_value) {
            std::construct_at(std::addressof(m_value), std::move(other.m_value));
        }
        else {
            std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }
    }

    constexpr ~Result() noexcept(std::is_nothrow_destructible_v<T>
                                 && std::is_nothrow_destructible_v<Error>)
    {
        if (m_has_value) {
            std::destroy_at(std::addressof(m_value));
        }
        else {
            std::destroy_at(std::addressof(m_error));
        }
    }

    [[nodiscard]] constexpr bool has_value() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return m_has_value;
    }

    [[nodiscard]] constexpr const T* operator->() const
    {
        if (!m_has_value) {
            throw Bad_Result_Access { "bad result access in operator->" };
        }
        return std::addressof(m_value);
    }

    [[nodiscard]] constexpr T* operator->()
    {
        if (!m_has_value) {
            throw Bad_Result_Access { "bad result access in operator->" };
        }
        return std::addressof(m_value);
    }

    [[nodiscard]] constexpr const Error& error() const&
    {
        if (m_has_value) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return m_error;
    }
};

} // namespace mdlex

#endif
