#ifndef MDLEX_MD_TOKEN_HPP
#define MDLEX_MD_TOKEN_HPP

#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "common/config.hpp"

#include "md/fwd.hpp"
#include "md/token_type.hpp"

namespace mdlex::md {

/// @brief An attribute of a link-family token.
enum struct Link_Attribute : Default_Underlying {
    /// @brief The bracketed text, e.g. `name` in `[name](location)`.
    name,
    /// @brief The target of the link, e.g. a URL or path.
    location,
    /// @brief The title in quotes following the location, with the quotes removed.
    title,
    /// @brief The reference tag, e.g. `tag` in `[name][tag]` or `[tag]: location`.
    reference,
};

/// @brief Returns the conventional attribute name, where `reference` is called `ptr`.
[[nodiscard]] constexpr std::string_view link_attribute_name(Link_Attribute attribute)
{
    switch (attribute) {
    case Link_Attribute::name: return "name";
    case Link_Attribute::location: return "location";
    case Link_Attribute::title: return "title";
    case Link_Attribute::reference: return "ptr";
    }
    MDLEX_ASSERT_UNREACHABLE("Unknown link attribute.");
}

using Link_Details = std::pmr::unordered_map<Link_Attribute, std::pmr::string>;

/// @brief A typed span of a lexed line.
/// The token owns a copy of its text, so it outlives the line it was lexed from.
struct Token {
    /// @brief The matched text, e.g. `**` for a `bold_mark` or `[a](b)` for a `link`.
    std::pmr::string value;
    Token_Type type {};
    /// @brief The attributes of a link-family token.
    /// Empty attribute values are never stored, so if present, this map is not empty.
    std::optional<Link_Details> details;

    [[nodiscard]] Token(std::string_view value,
                        Token_Type type,
                        std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : value { value, memory }
        , type { type }
    {
    }

    [[nodiscard]] Size length() const noexcept
    {
        return value.length();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return value.empty();
    }

    [[nodiscard]] std::pmr::memory_resource* get_memory() const noexcept
    {
        return value.get_allocator().resource();
    }

    /// @brief Returns the value of a link attribute, or `std::nullopt` if it was not stored.
    /// The type of this token shall be a link type (see `is_link`).
    [[nodiscard]] std::optional<std::string_view> attribute(Link_Attribute attribute) const;

    [[nodiscard]] std::optional<std::string_view> name() const
    {
        return attribute(Link_Attribute::name);
    }

    [[nodiscard]] std::optional<std::string_view> location() const
    {
        return attribute(Link_Attribute::location);
    }

    [[nodiscard]] std::optional<std::string_view> title() const
    {
        return attribute(Link_Attribute::title);
    }

    [[nodiscard]] std::optional<std::string_view> reference() const
    {
        return attribute(Link_Attribute::reference);
    }

    /// @brief Stores a link attribute. Empty values are ignored.
    /// The type of this token shall be a link type (see `is_link`).
    void set_attribute(Link_Attribute attribute, std::string_view value);

    /// @brief Shortens this token to its first `at` bytes and returns the rest as a new token
    /// of the same type.
    /// @param at the split offset, in range `(0, length())`
    [[nodiscard]] Token split_off(Size at);

    [[nodiscard]] friend bool operator==(const Token&, const Token&) = default;
};

} // namespace mdlex::md

#endif
