#include "common/assert.hpp"

#include "md/token.hpp"

namespace mdlex::md {

std::optional<std::string_view> Token::attribute(Link_Attribute attribute) const
{
    MDLEX_ASSERT(is_link(type));
    if (!details) {
        return {};
    }
    const auto it = details->find(attribute);
    if (it == details->end()) {
        return {};
    }
    return std::string_view { it->second };
}

void Token::set_attribute(Link_Attribute attribute, std::string_view attribute_value)
{
    MDLEX_ASSERT(is_link(type));
    if (attribute_value.empty()) {
        return;
    }
    if (!details) {
        details.emplace(Link_Details::allocator_type { get_memory() });
    }
    (*details)[attribute] = attribute_value;
}

Token Token::split_off(Size at)
{
    MDLEX_ASSERT(at != 0 && at < value.length());
    Token rest { std::string_view { value }.substr(at), type, get_memory() };
    value.resize(at);
    return rest;
}

} // namespace mdlex::md
