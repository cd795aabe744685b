#include "common/assert.hpp"

#include "md/tidy.hpp"

namespace mdlex::md {

namespace {

/// Runs longer than this are never opened and immediately become text.
constexpr Size max_delimiter_length = 3;

struct Run_Split {
    Size index;
    Size at;
};

[[nodiscard]] Token_Type resolved_type(const Token& delimiter)
{
    if (delimiter.type == Token_Type::back_tick) {
        return Token_Type::code_mark;
    }
    switch (delimiter.length()) {
    case 1: return Token_Type::italic_mark;
    case 2: return Token_Type::bold_mark;
    case 3: return Token_Type::italic_bold_mark;
    default: break;
    }
    MDLEX_ASSERT_UNREACHABLE("Emphasis runs longer than three characters cannot be matched.");
}

} // namespace

void normalize_runs(std::pmr::vector<Token>& tokens, Token_Type type)
{
    MDLEX_ASSERT(type == Token_Type::star || type == Token_Type::underline);

    std::pmr::vector<Run_Split> splits(tokens.get_allocator().resource());
    Size previous = 0;
    for (Size i = 0; i < tokens.size(); ++i) {
        if (tokens[i].type != type) {
            continue;
        }
        const Size length = tokens[i].length();
        if (previous == 0 || length < previous) {
            previous = length;
            continue;
        }
        const Size rest = length - previous;
        if (rest == 0) {
            previous = 0;
            continue;
        }
        splits.push_back({ .index = i, .at = previous });
        previous = rest;
    }

    // Inserting from the back keeps the recorded indices valid.
    for (auto it = splits.rbegin(); it != splits.rend(); ++it) {
        Token tail = tokens[it->index].split_off(it->at);
        tokens.insert(tokens.begin() + Difference(it->index + 1), std::move(tail));
    }
}

void resolve_delimiters(std::pmr::vector<Token>& tokens)
{
    std::pmr::vector<Size> open(tokens.get_allocator().resource());

    for (Size i = 0; i < tokens.size(); ++i) {
        Token& delimiter = tokens[i];
        if (!is_raw_delimiter(delimiter.type)) {
            continue;
        }

        Size match = open.size();
        for (Size j = open.size(); j-- > 0;) {
            const Token& candidate = tokens[open[j]];
            if (candidate.type == delimiter.type && candidate.value == delimiter.value) {
                match = j;
                break;
            }
        }

        if (match == open.size()) {
            if (delimiter.length() <= max_delimiter_length) {
                open.push_back(i);
            }
            else {
                delimiter.type = Token_Type::text;
            }
            continue;
        }

        const Token_Type type = resolved_type(delimiter);
        tokens[open[match]].type = type;
        delimiter.type = type;
        for (Size j = match + 1; j < open.size(); ++j) {
            tokens[open[j]].type = Token_Type::text;
        }
        open.resize(match);
    }

    for (const Size index : open) {
        tokens[index].type = Token_Type::text;
    }
}

void tidy(std::pmr::vector<Token>& tokens)
{
    normalize_runs(tokens, Token_Type::star);
    normalize_runs(tokens, Token_Type::underline);
    resolve_delimiters(tokens);
}

} // namespace mdlex::md
