#include "common/assert.hpp"
#include "common/parse.hpp"
#include "common/unicode.hpp"

#include "md/link_details.hpp"

namespace mdlex::md {

std::optional<Link_Destination> split_link_clause(std::string_view clause)
{
    clause = trim(clause);
    const Size space = clause.find_first_of(" \t");
    if (space == std::string_view::npos) {
        return Link_Destination { .location = clause, .title = {} };
    }

    const std::string_view location = clause.substr(0, space);
    const std::string_view title = clause.substr(clause.find_first_not_of(" \t", space));
    if (!is_quoted_string(title)) {
        return {};
    }
    return Link_Destination { .location = location,
                              .title = title.substr(1, title.length() - 2) };
}

Token make_link_token(std::string_view value,
                      std::string_view name,
                      std::string_view clause,
                      Token_Type type,
                      std::pmr::memory_resource* memory)
{
    MDLEX_ASSERT(is_link(type));

    switch (type) {
    case Token_Type::image:
    case Token_Type::link:
    case Token_Type::ref_link_def: {
        const std::optional<Link_Destination> destination = split_link_clause(clause);
        if (!destination) {
            return Token { value, Token_Type::text, memory };
        }
        Token result { value, type, memory };
        if (type == Token_Type::ref_link_def) {
            result.set_attribute(Link_Attribute::reference, name);
        }
        else {
            result.set_attribute(Link_Attribute::name, name);
        }
        result.set_attribute(Link_Attribute::location, destination->location);
        result.set_attribute(Link_Attribute::title, destination->title);
        return result;
    }

    case Token_Type::ref_link: {
        Token result { value, type, memory };
        result.set_attribute(Link_Attribute::name, name);
        result.set_attribute(Link_Attribute::reference, trim(clause));
        return result;
    }

    case Token_Type::quick_link: {
        Token result { value, type, memory };
        result.set_attribute(Link_Attribute::name, clause);
        result.set_attribute(Link_Attribute::location, clause);
        return result;
    }

    default: break;
    }
    MDLEX_ASSERT_UNREACHABLE("Not a link type.");
}

} // namespace mdlex::md
